#include "cancel_token.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <chrono>

CancelToken::CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

void CancelToken::cancel() {
    flag_->store(true);
}

bool CancelToken::is_canceled() const {
    return flag_->load();
}

bool CancelToken::sleep_for(int ms) const {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (!is_canceled()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return true;
        platform::sleep_ms(static_cast<int>(std::min<long long>(remaining, CANCEL_CHECK_SLICE_MS)));
    }
    return false;
}
