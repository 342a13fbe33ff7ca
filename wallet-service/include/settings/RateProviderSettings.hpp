#pragma once

#include "IRateProviderSettings.hpp"
#include <cstdlib>
#include <string>

namespace wallet::settings {

/**
 * @brief Настройки основного провайдера курсов
 *
 * Читает из ENV:
 * - EXCHANGE_RATE_API_HOST (default: "v6.exchangerate-api.com")
 * - EXCHANGE_RATE_API_PORT (default: 80)
 * - EXCHANGE_RATE_API_KEY (default: пусто, каждый запрос отклоняется)
 */
class RateProviderSettings : public IRateProviderSettings {
public:
    RateProviderSettings() {
        if (const char* host = std::getenv("EXCHANGE_RATE_API_HOST")) {
            host_ = host;
        }
        if (const char* port = std::getenv("EXCHANGE_RATE_API_PORT")) {
            port_ = std::stoi(port);
        }
        if (const char* key = std::getenv("EXCHANGE_RATE_API_KEY")) {
            apiKey_ = key;
        }
    }

    std::string getHost() const override { return host_; }
    int getPort() const override { return port_; }
    std::string getApiKey() const override { return apiKey_; }

private:
    std::string host_ = "v6.exchangerate-api.com";
    int port_ = 80;
    std::string apiKey_;
};

} // namespace wallet::settings
