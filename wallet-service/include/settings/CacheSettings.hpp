#pragma once

#include <cstdlib>
#include <string>

namespace wallet::settings {

/**
 * @brief Настройки кэша живых курсов
 *
 * Читает из ENV:
 * - CACHE_RATES_SIZE (default: 64)
 * - CACHE_RATES_TTL_SECONDS (default: 60)
 */
class CacheSettings {
public:
    CacheSettings() {
        if (const char* val = std::getenv("CACHE_RATES_SIZE")) {
            ratesCacheSize_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("CACHE_RATES_TTL_SECONDS")) {
            ratesTtlSeconds_ = std::stoi(val);
        }
    }

    size_t getRatesCacheSize() const { return ratesCacheSize_; }
    int getRatesTtlSeconds() const { return ratesTtlSeconds_; }

private:
    size_t ratesCacheSize_ = 64;
    int ratesTtlSeconds_ = 60;
};

} // namespace wallet::settings
