#pragma once

#include <atomic>

// Mutes/unmutes forwarded logs. Safe to use from any number of threads;
// the line-forwarding path only ever does a single atomic load.
class Muter {
public:
    void mute() { muted_.store(true); }
    void unmute() { muted_.store(false); }
    bool is_muted() const { return muted_.load(); }

private:
    std::atomic<bool> muted_{false};
};
