#pragma once

#include "ports/output/IFallbackRateTable.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace wallet::adapters::secondary {

/**
 * @brief Резервная таблица курсов в памяти процесса
 *
 * Точка хранится как shared_ptr<const RatePoint> и заменяется целиком,
 * поэтому читатель не увидит курс без соответствующего lastUpdated.
 */
class InMemoryFallbackRateTable : public ports::output::IFallbackRateTable {
public:
    std::optional<domain::RatePoint> find(domain::Currency from, domain::Currency to) const override {
        auto point = points_.find(pairKey(from, to));
        if (!point) {
            return std::nullopt;
        }
        return *point;
    }

    void put(const domain::RatePoint& point) override {
        points_.insert(
            pairKey(point.fromCurrency, point.toCurrency),
            std::make_shared<const domain::RatePoint>(point));
    }

    std::vector<domain::RatePoint> snapshot() const override {
        std::vector<domain::RatePoint> result;
        for (const auto& point : points_.values()) {
            result.push_back(*point);
        }
        std::sort(result.begin(), result.end(),
            [](const domain::RatePoint& a, const domain::RatePoint& b) {
                return pairKey(a.fromCurrency, a.toCurrency) < pairKey(b.fromCurrency, b.toCurrency);
            });
        return result;
    }

    size_t size() const {
        return points_.size();
    }

private:
    ThreadSafeMap<std::string, const domain::RatePoint> points_;

    static std::string pairKey(domain::Currency from, domain::Currency to) {
        return domain::toString(from) + "/" + domain::toString(to);
    }
};

} // namespace wallet::adapters::secondary
