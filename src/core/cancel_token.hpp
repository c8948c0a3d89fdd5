#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

// One-shot cancellation flag shared between a controller thread and a
// long-running stream. Once cancelled it stays cancelled.
class CancelToken {
public:
    using Hook = std::function<void()>;

    void cancel();
    bool cancelled() const { return cancelled_.load(); }

    // Sleep up to `d`. Returns true if the token was (or becomes) cancelled.
    bool wait_for(std::chrono::milliseconds d);

    // Run `hook` on cancel(); runs immediately if already cancelled.
    // Only one hook is kept. After clear_hook() returns the old hook is
    // no longer running and will not run again.
    void set_hook(Hook hook);
    void clear_hook();

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::mutex hook_mutex_;
    Hook hook_;
};
