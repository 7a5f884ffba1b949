#include "interrupt.hpp"
#include <signal.h>

namespace platform {

static CancelToken g_interrupt_token;
static struct sigaction g_old_int;
static struct sigaction g_old_term;
static bool g_installed = false;

static void interrupt_handler(int) {
    // Lock-free atomic store on an already-allocated flag.
    g_interrupt_token.cancel();
}

void on_interrupt(const CancelToken& token) {
    if (g_installed) remove_interrupt_handler();
    g_interrupt_token = token;

    struct sigaction sa;
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &g_old_int);
    sigaction(SIGTERM, &sa, &g_old_term);
    g_installed = true;
}

void remove_interrupt_handler() {
    if (!g_installed) return;
    sigaction(SIGINT, &g_old_int, nullptr);
    sigaction(SIGTERM, &g_old_term, nullptr);
    g_installed = false;
}

} // namespace platform
