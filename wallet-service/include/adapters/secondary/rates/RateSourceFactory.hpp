#pragma once

#include "ports/output/IRateSourceChain.hpp"
#include "adapters/secondary/rates/ExchangeRatesApiSource.hpp"
#include "adapters/secondary/rates/FixerApiSource.hpp"
#include "settings/IRateSourceSettings.hpp"
#include <IHttpClient.hpp>
#include <iostream>
#include <memory>
#include <set>
#include <vector>

namespace wallet::adapters::secondary::rates {

/**
 * @brief Строит цепочку источников по RATE_SOURCE_PRIORITY
 *
 * Набор источников закрыт (RateSourceKind). Неизвестные имена и повторы
 * пропускаются с предупреждением.
 */
class RateSourceFactory : public ports::output::IRateSourceChain {
public:
    RateSourceFactory(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IRateSourceSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::set<domain::RateSourceKind> seen;

        for (const auto& name : settings_->getPriority()) {
            auto kind = domain::rateSourceKindFromString(name);
            if (!kind) {
                std::cerr << "[RateSourceFactory] Unknown rate source '" << name << "', skipped" << std::endl;
                continue;
            }
            if (!seen.insert(*kind).second) {
                continue;
            }
            sources_.push_back(create(*kind));
        }

        std::cout << "[RateSourceFactory] Chain of " << sources_.size() << " sources" << std::endl;
    }

    std::vector<std::shared_ptr<ports::output::IRateSource>> sources() override {
        return sources_;
    }

    std::shared_ptr<ports::output::IRateSource> create(domain::RateSourceKind kind) const {
        switch (kind) {
            case domain::RateSourceKind::EXCHANGE_RATES_API:
                return std::make_shared<ExchangeRatesApiSource>(httpClient_, settings_);
            case domain::RateSourceKind::FIXER_API:
                return std::make_shared<FixerApiSource>(httpClient_, settings_);
        }
        return nullptr;
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IRateSourceSettings> settings_;
    std::vector<std::shared_ptr<ports::output::IRateSource>> sources_;
};

} // namespace wallet::adapters::secondary::rates
