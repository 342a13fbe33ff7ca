#pragma once

#include "ports/output/IRateSource.hpp"
#include "settings/IRateSourceSettings.hpp"
#include "domain/LedgerError.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>

namespace wallet::adapters::secondary::rates {

/**
 * @brief Общая часть источников с котировками от EUR
 *
 * Бесплатные тарифы exchangeratesapi.io и fixer.io отдают курсы только
 * от EUR: GET {path}?access_key=KEY&base=EUR
 * Ответ: {"success": true, "timestamp": ..., "base": "EUR", "rates": {...}}
 *
 * Из ответа берутся только валюты каталога, для каждой выдаются оба
 * направления: EUR→X = r и X→EUR = 1/r. Пары без EUR считаются через
 * EUR: X→Y = r(Y) / r(X), так что одно обновление покрывает весь каталог.
 */
class EuroBaseRateSource : public ports::output::IRateSource {
public:
    domain::RateSourceKind kind() const override { return kind_; }

    std::string name() const override { return name_; }

    bool isAvailable() override {
        if (endpoint_.apiKey.empty()) {
            return false;
        }

        try {
            auto response = doGet();
            if (response.getStatus() != 200) {
                std::cerr << "[" << name_ << "] Health check failed: " << response.getStatus() << std::endl;
                return false;
            }
            auto json = nlohmann::json::parse(response.getBody());
            return json.value("success", true);
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] Not available: " << e.what() << std::endl;
            return false;
        }
    }

    std::vector<domain::RatePoint> getRates() override {
        if (endpoint_.apiKey.empty()) {
            throw domain::RateProviderException(name_ + " key not configured");
        }

        auto response = doGet();
        if (response.getStatus() != 200) {
            throw domain::RateProviderException(
                name_ + " returned status " + std::to_string(response.getStatus()));
        }

        std::map<domain::Currency, double> eurRates;
        domain::Timestamp timestamp = domain::Timestamp::now();
        try {
            auto json = nlohmann::json::parse(response.getBody());

            if (!json.value("success", true)) {
                auto error = json.value("error", nlohmann::json::object());
                throw domain::RateProviderException(
                    name_ + " error: " + error.value("info", error.value("type", std::string("unknown"))));
            }
            if (!json.contains("rates") || !json["rates"].is_object()) {
                throw domain::RateProviderException(name_ + " response has no rates");
            }

            int64_t seconds = json.value("timestamp", static_cast<int64_t>(0));
            if (seconds > 0) {
                timestamp = domain::Timestamp::fromUnixSeconds(seconds);
            }

            for (const auto& [code, value] : json["rates"].items()) {
                if (!domain::isSupportedCurrency(code) || code == "EUR" || !value.is_number()) {
                    continue;
                }
                eurRates[domain::currencyFromString(code)] = value.get<double>();
            }

        } catch (const domain::RateProviderException&) {
            throw;
        } catch (const std::exception& e) {
            throw domain::RateProviderException(name_ + " returned malformed body: " + e.what());
        }

        std::vector<domain::RatePoint> points;
        for (const auto& [currency, rate] : eurRates) {
            points.emplace_back(domain::Currency::EUR, currency, rate, timestamp, name_);
            points.emplace_back(currency, domain::Currency::EUR, 1.0 / rate, timestamp, name_);
        }

        // Кросс-курсы X→Y = (EUR→Y) / (EUR→X)
        for (auto from = eurRates.begin(); from != eurRates.end(); ++from) {
            if (!domain::isValidRate(from->second)) {
                continue;
            }
            for (auto to = std::next(from); to != eurRates.end(); ++to) {
                if (!domain::isValidRate(to->second)) {
                    continue;
                }
                double cross = to->second / from->second;
                points.emplace_back(from->first, to->first, cross, timestamp, name_);
                points.emplace_back(to->first, from->first, 1.0 / cross, timestamp, name_);
            }
        }

        std::cout << "[" << name_ << "] Fetched " << points.size() << " rate points" << std::endl;
        return points;
    }

protected:
    EuroBaseRateSource(
        std::shared_ptr<IHttpClient> httpClient,
        settings::RateSourceEndpoint endpoint,
        domain::RateSourceKind kind,
        std::string name,
        std::string path
    ) : httpClient_(std::move(httpClient))
      , endpoint_(std::move(endpoint))
      , kind_(kind)
      , name_(std::move(name))
      , path_(std::move(path))
    {
        if (endpoint_.apiKey.empty()) {
            std::cerr << "[" << name_ << "] API key not found in configuration" << std::endl;
        }
        std::cout << "[" << name_ << "] Created, target: "
                  << endpoint_.host << ":" << endpoint_.port << std::endl;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    settings::RateSourceEndpoint endpoint_;
    domain::RateSourceKind kind_;
    std::string name_;
    std::string path_;

    SimpleResponse doGet() {
        SimpleRequest request(
            "GET",
            path_ + "?access_key=" + endpoint_.apiKey + "&base=EUR",
            "",
            endpoint_.host,
            endpoint_.port,
            {}
        );

        SimpleResponse response;
        bool sent = false;
        try {
            sent = httpClient_->send(request, response);
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] send error: " << e.what() << std::endl;
            throw domain::RateProviderException("Failed to reach " + name_ + ": " + e.what());
        }
        if (!sent) {
            throw domain::RateProviderException("Failed to reach " + name_);
        }
        return response;
    }
};

} // namespace wallet::adapters::secondary::rates
