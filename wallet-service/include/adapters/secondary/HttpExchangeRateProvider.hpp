#pragma once

#include "ports/output/IRateProvider.hpp"
#include "settings/IRateProviderSettings.hpp"
#include "domain/LedgerError.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace wallet::adapters::secondary {

/**
 * @brief HTTP клиент к основному провайдеру курсов
 *
 * GET /latest/{BASE}, заголовок X-Api-Key.
 * Ответ: {"base": "USD", "rates": {"EUR": 0.92, ...}, "timestamp": 1700000000}
 *
 * Любая ошибка (нет ключа, сеть, не 200, неверное тело) отдаётся как
 * RateProviderException; повторы делает вызывающая сторона.
 */
class HttpExchangeRateProvider : public ports::output::IRateProvider {
public:
    HttpExchangeRateProvider(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IRateProviderSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpExchangeRateProvider] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
        if (settings_->getApiKey().empty()) {
            std::cerr << "[HttpExchangeRateProvider] EXCHANGE_RATE_API_KEY is not set, "
                      << "live rates are unavailable" << std::endl;
        }
    }

    domain::RateTable fetchRates(const std::string& base) override {
        if (settings_->getApiKey().empty()) {
            throw domain::RateProviderException("Exchange rate API key not configured");
        }

        SimpleRequest request(
            "GET",
            "/latest/" + base,
            "",
            settings_->getHost(),
            settings_->getPort(),
            {{"X-Api-Key", settings_->getApiKey()}}
        );

        SimpleResponse response;
        bool sent = false;
        try {
            sent = httpClient_->send(request, response);
        } catch (const std::exception& e) {
            std::cerr << "[HttpExchangeRateProvider] send error: " << e.what() << std::endl;
            throw domain::RateProviderException(std::string("Failed to reach FX service: ") + e.what());
        }
        if (!sent) {
            throw domain::RateProviderException("Failed to reach FX service");
        }

        if (response.getStatus() != 200) {
            std::cerr << "[HttpExchangeRateProvider] FX API Error: Status "
                      << response.getStatus() << ", Data: " << response.getBody() << std::endl;
            throw domain::RateProviderException(
                "FX API returned status " + std::to_string(response.getStatus()));
        }

        try {
            auto json = nlohmann::json::parse(response.getBody());
            if (!json.is_object() || !json.contains("rates") || !json["rates"].is_object()) {
                throw domain::RateProviderException("Invalid response data received from FX API");
            }

            domain::RateTable table;
            table.base = json.value("base", base);

            for (const auto& [code, value] : json["rates"].items()) {
                if (value.is_number()) {
                    table.rates[code] = value.get<double>();
                }
            }

            int64_t timestamp = json.value("timestamp", static_cast<int64_t>(0));
            table.timestamp = timestamp > 0
                ? domain::Timestamp::fromUnixSeconds(timestamp)
                : domain::Timestamp::now();

            std::cout << "[HttpExchangeRateProvider] Fetched " << table.rates.size()
                      << " rates for " << base << std::endl;
            return table;

        } catch (const domain::RateProviderException&) {
            throw;
        } catch (const std::exception& e) {
            throw domain::RateProviderException(
                std::string("Malformed FX API response: ") + e.what());
        }
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IRateProviderSettings> settings_;
};

} // namespace wallet::adapters::secondary
