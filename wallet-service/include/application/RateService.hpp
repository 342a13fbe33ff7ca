#pragma once

#include "ports/input/IRateService.hpp"
#include "ports/input/IFallbackRateService.hpp"
#include "ports/output/IRateProvider.hpp"
#include "application/RetryPolicy.hpp"
#include "domain/LedgerError.hpp"
#include "domain/RatePoint.hpp"
#include <memory>
#include <iostream>

namespace wallet::application {

/**
 * @brief Сервис получения курсов
 *
 * Основной путь: кэш по базовой валюте (CachedRateProvider) →
 * при промахе живой запрос к провайдеру с повторами (RetryPolicy).
 *
 * Если провайдер недоступен после всех повторов или в ответе нет
 * нужной валюты, курс не подставляется молча из резервной таблицы:
 * наружу уходит RateUnavailable. Резервная таблица используется только
 * при явном allowFallback = true.
 */
class RateService : public ports::input::IRateService {
public:
    RateService(
        std::shared_ptr<ports::output::IRateProvider> provider,
        std::shared_ptr<RetryPolicy> retryPolicy,
        std::shared_ptr<ports::input::IFallbackRateService> fallbackRates
    ) : provider_(std::move(provider))
      , retryPolicy_(std::move(retryPolicy))
      , fallbackRates_(std::move(fallbackRates))
    {
        std::cout << "[RateService] Created" << std::endl;
    }

    domain::RateTable getRates(const std::string& base) override {
        try {
            return retryPolicy_->execute(
                [this, &base]() { return provider_->fetchRates(base); },
                "fetching rates for " + base);
        } catch (const std::exception& e) {
            std::cerr << "[RateService] Failed to fetch rates for " << base
                      << ": " << e.what() << std::endl;
            throw domain::LedgerException(
                domain::LedgerErrorCode::RateUnavailable,
                "Failed to fetch exchange rates for " + base + " after multiple attempts");
        }
    }

    domain::ConversionQuote convert(
        domain::Currency from,
        domain::Currency to,
        const domain::Decimal& amount) override
    {
        if (!amount.isPositive()) {
            throw domain::LedgerException(
                domain::LedgerErrorCode::InvalidAmount, "Conversion amount must be positive");
        }

        auto resolved = resolveRate(from, to, false);

        domain::ConversionQuote quote;
        quote.fromCurrency = from;
        quote.toCurrency = to;
        quote.amount = amount;
        quote.rate = domain::Decimal::fromDouble(resolved.rate);
        quote.convertedAmount = amount * quote.rate;
        return quote;
    }

    domain::ResolvedRate resolveRate(
        domain::Currency from,
        domain::Currency to,
        bool allowFallback) override
    {
        if (from == to) {
            return {1.0, domain::RateOrigin::LIVE};
        }

        try {
            return {liveRate(from, to), domain::RateOrigin::LIVE};
        } catch (const domain::LedgerException& e) {
            if (!allowFallback || e.code() != domain::LedgerErrorCode::RateUnavailable) {
                throw;
            }
            double rate = fallbackRates_->getRate(from, to);
            std::cerr << "[RateService] Live rate unavailable for "
                      << domain::toString(from) << "/" << domain::toString(to)
                      << ", using fallback " << rate << std::endl;
            return {rate, domain::RateOrigin::FALLBACK};
        }
    }

private:
    std::shared_ptr<ports::output::IRateProvider> provider_;
    std::shared_ptr<RetryPolicy> retryPolicy_;
    std::shared_ptr<ports::input::IFallbackRateService> fallbackRates_;

    double liveRate(domain::Currency from, domain::Currency to) {
        auto table = getRates(domain::toString(from));
        auto rate = table.rateFor(domain::toString(to));

        if (!rate || !domain::isValidRate(*rate)) {
            std::cerr << "[RateService] Exchange rate not found for "
                      << domain::toString(from) << " -> " << domain::toString(to) << std::endl;
            throw domain::LedgerException(
                domain::LedgerErrorCode::RateUnavailable,
                "Exchange rate not available for " + domain::toString(from) +
                " to " + domain::toString(to));
        }
        return *rate;
    }
};

} // namespace wallet::application
