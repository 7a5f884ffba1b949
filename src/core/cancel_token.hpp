#pragma once

#include <atomic>
#include <memory>

// Shared cancellation flag. Copies observe the same flag, so a token handed
// to a reader can be cancelled from another thread or a signal handler.
class CancelToken {
public:
    CancelToken();

    void cancel();
    bool is_canceled() const;

    // Sleep for up to ms milliseconds in short slices, waking early if the
    // token is cancelled. Returns false if cancelled.
    bool sleep_for(int ms) const;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
