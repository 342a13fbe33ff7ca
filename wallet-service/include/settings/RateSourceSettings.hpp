#pragma once

#include "IRateSourceSettings.hpp"
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace wallet::settings {

/**
 * @brief Настройки источников резервных курсов
 *
 * Читает из ENV:
 * - EXCHANGE_RATES_API_HOST (default: "api.exchangeratesapi.io")
 * - EXCHANGE_RATES_API_PORT (default: 80)
 * - EXCHANGE_RATES_API_KEY
 * - FIXER_API_HOST (default: "data.fixer.io")
 * - FIXER_API_PORT (default: 80)
 * - FIXER_API_KEY
 * - RATE_SOURCE_PRIORITY (default: "exchangeratesapi,fixer")
 *
 * Источник без ключа остаётся в цепочке, но сообщает isAvailable() == false.
 */
class RateSourceSettings : public IRateSourceSettings {
public:
    RateSourceSettings() {
        exchangeRatesApi_.host = getEnvOrDefault("EXCHANGE_RATES_API_HOST", "api.exchangeratesapi.io");
        exchangeRatesApi_.port = std::stoi(getEnvOrDefault("EXCHANGE_RATES_API_PORT", "80"));
        exchangeRatesApi_.apiKey = getEnvOrDefault("EXCHANGE_RATES_API_KEY", "");

        fixerApi_.host = getEnvOrDefault("FIXER_API_HOST", "data.fixer.io");
        fixerApi_.port = std::stoi(getEnvOrDefault("FIXER_API_PORT", "80"));
        fixerApi_.apiKey = getEnvOrDefault("FIXER_API_KEY", "");

        std::stringstream ss(getEnvOrDefault("RATE_SOURCE_PRIORITY", "exchangeratesapi,fixer"));
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) {
                priority_.push_back(item);
            }
        }
    }

    RateSourceEndpoint getExchangeRatesApi() const override { return exchangeRatesApi_; }
    RateSourceEndpoint getFixerApi() const override { return fixerApi_; }
    std::vector<std::string> getPriority() const override { return priority_; }

private:
    RateSourceEndpoint exchangeRatesApi_;
    RateSourceEndpoint fixerApi_;
    std::vector<std::string> priority_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace wallet::settings
