#pragma once

#include "IFallbackRateSettings.hpp"
#include <cstdlib>
#include <string>

namespace wallet::settings {

/**
 * @brief Настройки резервной таблицы курсов
 *
 * Читает из ENV:
 * - FALLBACK_RATE_MAX_AGE_SECONDS (default: 3600)
 * - FALLBACK_RATE_CHANGE_ALERT_PERCENT (default: 5)
 * - FALLBACK_REFRESH_INTERVAL_SECONDS (default: 3600)
 */
class FallbackRateSettings : public IFallbackRateSettings {
public:
    FallbackRateSettings() {
        if (const char* val = std::getenv("FALLBACK_RATE_MAX_AGE_SECONDS")) {
            maxAgeSeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("FALLBACK_RATE_CHANGE_ALERT_PERCENT")) {
            changeAlertPercent_ = std::stod(val);
        }
        if (const char* val = std::getenv("FALLBACK_REFRESH_INTERVAL_SECONDS")) {
            refreshIntervalSeconds_ = std::stoi(val);
        }
    }

    int getMaxAgeSeconds() const override { return maxAgeSeconds_; }
    double getChangeAlertPercent() const override { return changeAlertPercent_; }
    int getRefreshIntervalSeconds() const override { return refreshIntervalSeconds_; }

private:
    int maxAgeSeconds_ = 3600;
    double changeAlertPercent_ = 5.0;
    int refreshIntervalSeconds_ = 3600;
};

} // namespace wallet::settings
