#pragma once

#include "adapters/secondary/rates/EuroBaseRateSource.hpp"

namespace wallet::adapters::secondary::rates {

/**
 * @brief Источник курсов fixer.io (GET /api/latest)
 */
class FixerApiSource : public EuroBaseRateSource {
public:
    FixerApiSource(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IRateSourceSettings> settings)
        : EuroBaseRateSource(
            std::move(httpClient),
            settings->getFixerApi(),
            domain::RateSourceKind::FIXER_API,
            "Fixer API",
            "/api/latest")
    {}
};

} // namespace wallet::adapters::secondary::rates
