#pragma once

#include <core/cancel_token.hpp>

namespace platform {

// Cancel token on SIGINT/SIGTERM. The previous handlers are saved and
// restored by remove_interrupt_handler().
void on_interrupt(const CancelToken& token);
void remove_interrupt_handler();

// RAII wrapper for on_interrupt()/remove_interrupt_handler().
struct InterruptGuard {
    explicit InterruptGuard(const CancelToken& token) { on_interrupt(token); }
    ~InterruptGuard() { remove_interrupt_handler(); }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;
};

} // namespace platform
