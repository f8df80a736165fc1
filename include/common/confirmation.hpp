#pragma once

#include <functional>
#include <string>

// Decides yes/no questions on behalf of the operator. Core components never
// touch the terminal; the CLI supplies an interactive policy.
class ConfirmationPolicy {
public:
    using Callback = std::function<bool(const std::string& question)>;

    static ConfirmationPolicy alwaysYes() {
        return ConfirmationPolicy([](const std::string&) { return true; });
    }
    static ConfirmationPolicy alwaysNo() {
        return ConfirmationPolicy([](const std::string&) { return false; });
    }
    static ConfirmationPolicy fromCallback(Callback callback) {
        return ConfirmationPolicy(std::move(callback));
    }

    // force short-circuits the question.
    bool confirm(const std::string& question, bool force = false) const {
        return force || (callback_ && callback_(question));
    }

private:
    explicit ConfirmationPolicy(Callback callback) : callback_(std::move(callback)) {}

    Callback callback_;
};
