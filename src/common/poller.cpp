#include "common/poller.hpp"
#include "common/logger.hpp"
#include <thread>

Sleeper threadSleeper() {
    return [](std::chrono::milliseconds duration) {
        std::this_thread::sleep_for(duration);
    };
}

Poller::Poller() : sleeper_(threadSleeper()) {
}

Poller::Poller(Sleeper sleeper) : sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = threadSleeper();
    }
}

Status Poller::waitUntil(const std::function<bool()>& predicate,
                         std::chrono::milliseconds interval,
                         int maxAttempts,
                         const std::string& description) const {
    const bool unbounded = maxAttempts == kUnbounded;
    const std::string limit = unbounded ? std::string("unbounded") : std::to_string(maxAttempts);
    for (long long attempt = 1; unbounded || attempt <= maxAttempts; ++attempt) {
        if (predicate()) {
            return Status::ok();
        }
        Logger::debug("Waiting for " + description + " (" + std::to_string(attempt) + "/" + limit + ")");
        sleeper_(interval);
    }
    return makeError(ErrorKind::TimeoutExceeded,
                     "Timed out waiting for " + description + " after " + std::to_string(maxAttempts) +
                     " attempts");
}

void Poller::sleep(std::chrono::milliseconds duration) const {
    sleeper_(duration);
}
