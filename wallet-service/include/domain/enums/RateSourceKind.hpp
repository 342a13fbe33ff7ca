#pragma once

#include <string>
#include <optional>
#include <algorithm>
#include <cctype>

namespace wallet::domain {

/**
 * @brief Закрытый набор источников курсов для резервной таблицы
 */
enum class RateSourceKind {
    EXCHANGE_RATES_API,
    FIXER_API
};

inline std::string toString(RateSourceKind kind) {
    switch (kind) {
        case RateSourceKind::EXCHANGE_RATES_API: return "exchangeratesapi";
        case RateSourceKind::FIXER_API:          return "fixer";
    }
    return "unknown";
}

/**
 * @brief Разобрать имя из RATE_SOURCE_PRIORITY (регистр не важен)
 */
inline std::optional<RateSourceKind> rateSourceKindFromString(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    if (str == "exchangeratesapi") return RateSourceKind::EXCHANGE_RATES_API;
    if (str == "fixer")            return RateSourceKind::FIXER_API;
    return std::nullopt;
}

} // namespace wallet::domain
