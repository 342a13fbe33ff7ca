#pragma once

#include "domain/RatePoint.hpp"
#include <optional>
#include <vector>

namespace wallet::ports::output {

/**
 * @brief Резервная таблица курсов (from, to) -> RatePoint
 *
 * Запись одной пары атомарна: читатель видит либо старую точку
 * целиком, либо новую целиком.
 */
class IFallbackRateTable {
public:
    virtual ~IFallbackRateTable() = default;

    virtual std::optional<domain::RatePoint> find(
        domain::Currency from, domain::Currency to) const = 0;

    virtual void put(const domain::RatePoint& point) = 0;

    /**
     * @brief Копия всех точек
     */
    virtual std::vector<domain::RatePoint> snapshot() const = 0;
};

} // namespace wallet::ports::output
