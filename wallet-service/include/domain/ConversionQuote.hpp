#pragma once

#include "Decimal.hpp"
#include "enums/Currency.hpp"
#include <string>

namespace wallet::domain {

/**
 * @brief Откуда взят курс
 */
enum class RateOrigin {
    LIVE,     ///< Живой провайдер (через кэш)
    FALLBACK  ///< Резервная таблица, пониженная точность
};

inline std::string toString(RateOrigin origin) {
    return origin == RateOrigin::LIVE ? "live" : "fallback";
}

/**
 * @brief Результат resolveRate
 */
struct ResolvedRate {
    double rate = 0.0;
    RateOrigin origin = RateOrigin::LIVE;
};

/**
 * @brief Котировка конвертации: convertedAmount = amount * rate
 */
struct ConversionQuote {
    Currency fromCurrency = Currency::NGN;
    Currency toCurrency = Currency::NGN;
    Decimal amount;
    Decimal rate;
    Decimal convertedAmount;
};

} // namespace wallet::domain
