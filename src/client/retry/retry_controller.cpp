#include "retry_controller.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace retry
{
    RetryController::RetryController(RetryPolicy policy, Sleeper sleeper)
        : policy_(policy), sleeper_(std::move(sleeper))
    {
        if (policy_.maxRetries < 1)
        {
            throw std::invalid_argument("max_retries must be at least 1");
        }
        if (policy_.initialDelay.count() < 0 || policy_.maxDelay.count() < 0)
        {
            throw std::invalid_argument("retry delays must not be negative");
        }
        if (!sleeper_)
        {
            sleeper_ = [](Seconds delay)
            { std::this_thread::sleep_for(delay); };
        }
    }

    Seconds RetryController::delayFor(int attempt) const
    {
        Seconds delay = policy_.initialDelay * std::pow(2.0, attempt);
        if (policy_.maxDelay.count() > 0 && delay > policy_.maxDelay)
        {
            delay = policy_.maxDelay;
        }
        return delay;
    }

    void RetryController::backoff(int attempt, const errors::TransportError &error, const std::string &label) const
    {
        Seconds delay = delayFor(attempt);
        std::ostringstream msg;
        msg << "Retry " << (attempt + 1) << "/" << policy_.maxRetries << " for " << label
            << " after " << delay.count() << "s (" << error.what() << ")";
        MyLogger::warning(msg.str());
        sleeper_(delay);
    }
}
