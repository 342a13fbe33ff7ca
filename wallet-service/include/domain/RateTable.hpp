#pragma once

#include "Timestamp.hpp"
#include <map>
#include <optional>
#include <string>

namespace wallet::domain {

/**
 * @brief Полная таблица курсов от внешнего провайдера для одной базы
 *
 * rates[code] = сколько единиц code стоит 1 единица base.
 * Коды могут быть вне каталога: провайдер отдаёт всё, что знает.
 */
struct RateTable {
    std::string base;
    std::map<std::string, double> rates;
    Timestamp timestamp;

    std::optional<double> rateFor(const std::string& code) const {
        auto it = rates.find(code);
        if (it == rates.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

} // namespace wallet::domain
