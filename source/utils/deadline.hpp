#ifndef TABSCOUT_DEADLINE_HPP
#define TABSCOUT_DEADLINE_HPP

// Deadline and cancellation primitives for bounded blocking waits.

#include <atomic>
#include <chrono>

namespace deadline {

// A point in steady-clock time after which a wait must give up.
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    explicit Deadline(clock::time_point expires_at) : expires_at_(expires_at) {}

    static Deadline after_milliseconds(int timeout_milliseconds) {
        if (timeout_milliseconds < 0) {
            timeout_milliseconds = 0;
        }
        return Deadline(clock::now() + std::chrono::milliseconds(timeout_milliseconds));
    }

    bool expired() const { return clock::now() >= expires_at_; }

    // Milliseconds left before expiry, never negative.
    int remaining_milliseconds() const {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(expires_at_ - clock::now());
        return remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
    }

private:
    clock::time_point expires_at_;
};

// Set once by the owner; polled by waits that accept it.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace deadline

#endif // TABSCOUT_DEADLINE_HPP
