#pragma once

#include "IRetrySettings.hpp"
#include <cstdlib>
#include <string>

namespace wallet::settings {

/**
 * @brief Политика повторов запросов к провайдерам курсов
 *
 * Читает из ENV:
 * - FX_RETRY_MAX_ATTEMPTS (default: 3)
 * - FX_RETRY_INITIAL_DELAY_MS (default: 1000)
 * - FX_RETRY_BACKOFF_FACTOR (default: 2)
 * - FX_RETRY_MAX_DELAY_MS (default: 5000)
 */
class RetrySettings : public IRetrySettings {
public:
    RetrySettings() {
        if (const char* val = std::getenv("FX_RETRY_MAX_ATTEMPTS")) {
            maxAttempts_ = std::stoi(val);
        }
        if (const char* val = std::getenv("FX_RETRY_INITIAL_DELAY_MS")) {
            initialDelayMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("FX_RETRY_BACKOFF_FACTOR")) {
            backoffFactor_ = std::stod(val);
        }
        if (const char* val = std::getenv("FX_RETRY_MAX_DELAY_MS")) {
            maxDelayMs_ = std::stoi(val);
        }
    }

    int getMaxAttempts() const override { return maxAttempts_; }
    std::chrono::milliseconds getInitialDelay() const override {
        return std::chrono::milliseconds(initialDelayMs_);
    }
    double getBackoffFactor() const override { return backoffFactor_; }
    std::chrono::milliseconds getMaxDelay() const override {
        return std::chrono::milliseconds(maxDelayMs_);
    }

private:
    int maxAttempts_ = 3;
    int initialDelayMs_ = 1000;
    double backoffFactor_ = 2.0;
    int maxDelayMs_ = 5000;
};

} // namespace wallet::settings
