#pragma once

#include "Timestamp.hpp"
#include "enums/Currency.hpp"
#include <string>
#include <cmath>

namespace wallet::domain {

/**
 * @brief Направленный курс: 1 fromCurrency = rate toCurrency
 */
struct RatePoint {
    Currency fromCurrency = Currency::NGN;
    Currency toCurrency = Currency::NGN;
    double rate = 0.0;
    Timestamp lastUpdated;
    std::string source;  ///< Откуда получен ("baseline", "Fixer API", ...)

    RatePoint() = default;

    RatePoint(Currency from, Currency to, double r, Timestamp updated, std::string src)
        : fromCurrency(from), toCurrency(to), rate(r)
        , lastUpdated(updated), source(std::move(src)) {}
};

/// Верхняя граница допустимого курса
constexpr double MAX_VALID_RATE = 1000000.0;

/**
 * @brief Курс пригоден к записи: конечен, > 0 и < MAX_VALID_RATE
 */
inline bool isValidRate(double rate) {
    return std::isfinite(rate) && rate > 0.0 && rate < MAX_VALID_RATE;
}

} // namespace wallet::domain
