#pragma once

#include "adapters/secondary/rates/EuroBaseRateSource.hpp"

namespace wallet::adapters::secondary::rates {

/**
 * @brief Источник курсов exchangeratesapi.io (GET /v1/latest)
 */
class ExchangeRatesApiSource : public EuroBaseRateSource {
public:
    ExchangeRatesApiSource(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IRateSourceSettings> settings)
        : EuroBaseRateSource(
            std::move(httpClient),
            settings->getExchangeRatesApi(),
            domain::RateSourceKind::EXCHANGE_RATES_API,
            "Exchange Rates API",
            "/v1/latest")
    {}
};

} // namespace wallet::adapters::secondary::rates
