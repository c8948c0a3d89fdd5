#include "cancel_token.hpp"

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true)) return;
    }
    cv_.notify_all();

    // Held while the hook runs so clear_hook() cannot return mid-call
    std::lock_guard<std::mutex> lock(hook_mutex_);
    if (hook_) hook_();
}

bool CancelToken::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, d, [this] { return cancelled_.load(); });
}

void CancelToken::set_hook(Hook hook) {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    hook_ = std::move(hook);
    if (cancelled_.load() && hook_) hook_();
}

void CancelToken::clear_hook() {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    hook_ = nullptr;
}
