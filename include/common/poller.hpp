#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "common/result.hpp"

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Blocks the calling thread between checks. Tests inject a no-op sleeper.
Sleeper threadSleeper();

class Poller {
public:
    static constexpr int kUnbounded = -1;

    Poller();
    explicit Poller(Sleeper sleeper);

    // Calls predicate until it returns true, sleeping interval between calls.
    // Returns TimeoutExceeded once maxAttempts checks have failed; with
    // kUnbounded it keeps checking until predicate holds.
    Status waitUntil(const std::function<bool()>& predicate,
                     std::chrono::milliseconds interval,
                     int maxAttempts,
                     const std::string& description = "condition") const;

    void sleep(std::chrono::milliseconds duration) const;

private:
    Sleeper sleeper_;
};
