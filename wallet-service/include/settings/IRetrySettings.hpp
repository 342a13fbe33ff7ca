#pragma once

#include <chrono>

namespace wallet::settings {

class IRetrySettings {
public:
    virtual ~IRetrySettings() = default;

    virtual int getMaxAttempts() const = 0;
    virtual std::chrono::milliseconds getInitialDelay() const = 0;
    virtual double getBackoffFactor() const = 0;
    virtual std::chrono::milliseconds getMaxDelay() const = 0;
};

} // namespace wallet::settings
