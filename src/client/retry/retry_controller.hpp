#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "common/errors/errors.hpp"
#include "logger/Mylogger.hpp"

namespace retry
{
    using Seconds = std::chrono::duration<double>;

    struct RetryPolicy
    {
        int maxRetries = 3;          // total attempts, at least 1
        Seconds initialDelay{1.0};   // delay after the first failure
        Seconds maxDelay{0.0};       // 0 means uncapped
    };

    // Runs an operation up to maxRetries times, sleeping initialDelay * 2^k
    // after failed attempt k. Only errors::TransportError is retried; anything
    // else (errors::AuthError in particular) escapes on the first throw.
    class RetryController
    {
    public:
        using Sleeper = std::function<void(Seconds)>;

        explicit RetryController(RetryPolicy policy = RetryPolicy(), Sleeper sleeper = nullptr);

        // Delay slept after failed attempt k (0-indexed).
        Seconds delayFor(int attempt) const;

        const RetryPolicy &policy() const { return policy_; }

        template <typename Operation>
        auto attempt(Operation &&operation, const std::string &label = "operation") -> decltype(operation())
        {
            std::optional<errors::TransportError> last;
            for (int k = 0; k < policy_.maxRetries; ++k)
            {
                try
                {
                    return operation();
                }
                catch (const errors::TransportError &e)
                {
                    last.emplace(e);
                    if (k + 1 < policy_.maxRetries)
                    {
                        backoff(k, e, label);
                    }
                }
            }
            MyLogger::error("All " + std::to_string(policy_.maxRetries) + " retry attempts failed for " + label);
            throw errors::TransferExhausted(*last, policy_.maxRetries);
        }

    private:
        void backoff(int attempt, const errors::TransportError &error, const std::string &label) const;

        RetryPolicy policy_;
        Sleeper sleeper_;
    };
}
