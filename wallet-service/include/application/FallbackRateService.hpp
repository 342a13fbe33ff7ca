#pragma once

#include "ports/input/IFallbackRateService.hpp"
#include "ports/output/IFallbackRateTable.hpp"
#include "ports/output/IRateSourceChain.hpp"
#include "settings/IFallbackRateSettings.hpp"
#include "domain/LedgerError.hpp"
#include "domain/RatePoint.hpp"
#include <atomic>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <string>
#include <tuple>
#include <vector>

namespace wallet::application {

/**
 * @brief Резервная таблица курсов: начальное заполнение, обновление, чтение
 *
 * При создании таблица заполняется базовыми константами для всех пар
 * каталога, оба направления взаимно обратны. Дальше её меняет только цикл обновления:
 *
 * 1. Источники перебираются в порядке приоритета
 * 2. Недоступный источник (isAvailable() == false) пропускается
 * 3. Из первого источника, вернувшего хотя бы один корректный курс,
 *    записываются все корректные курсы вместе с точной обратной
 *    величиной 1/R, после чего цикл завершается (без слияния источников)
 * 4. Если не ответил ни один источник, таблица не меняется и
 *    бросается RateProviderException
 *
 * Изменение курса больше чем на changeAlertPercent только логируется.
 */
class FallbackRateService : public ports::input::IFallbackRateService {
public:
    FallbackRateService(
        std::shared_ptr<ports::output::IFallbackRateTable> table,
        std::shared_ptr<ports::output::IRateSourceChain> sourceChain,
        std::shared_ptr<settings::IFallbackRateSettings> settings
    ) : table_(std::move(table))
      , sourceChain_(std::move(sourceChain))
      , settings_(std::move(settings))
    {
        seedBaseline();
        std::cout << "[FallbackRateService] Created, maxAge=" << settings_->getMaxAgeSeconds()
                  << "s alert=" << settings_->getChangeAlertPercent() << "%" << std::endl;
    }

    double getRate(domain::Currency from, domain::Currency to) override {
        if (from == to) {
            return 1.0;
        }

        auto point = table_->find(from, to);
        if (!point) {
            std::cerr << "[FallbackRateService] No fallback rate found for "
                      << domain::toString(from) << " to " << domain::toString(to) << std::endl;
            return baselineRate(from, to).value_or(1.0);
        }

        if (isStale(*point, domain::Timestamp::now())) {
            std::cerr << "[FallbackRateService] Serving stale rate for "
                      << domain::toString(from) << "/" << domain::toString(to)
                      << " (updated " << point->lastUpdated.toString() << ")" << std::endl;
        }
        return point->rate;
    }

    void refresh() override {
        std::lock_guard<std::mutex> lock(refreshMutex_);

        std::string lastError = "no rate sources configured";

        for (const auto& source : sourceChain_->sources()) {
            try {
                if (!source->isAvailable()) {
                    std::cerr << "[FallbackRateService] " << source->name()
                              << " is not available, trying next source" << std::endl;
                    lastError = source->name() + " is not available";
                    continue;
                }

                auto valid = validRates(source->getRates(), source->name());
                if (valid.empty()) {
                    std::cerr << "[FallbackRateService] " << source->name()
                              << " returned no valid rates, trying next source" << std::endl;
                    lastError = source->name() + " returned no valid rates";
                    continue;
                }

                applyRates(valid, source->name());
                std::cout << "[FallbackRateService] Successfully updated " << valid.size()
                          << " rates from " << source->name() << std::endl;
                return;

            } catch (const std::exception& e) {
                std::cerr << "[FallbackRateService] Failed to fetch rates from "
                          << source->name() << ": " << e.what() << std::endl;
                lastError = e.what();
            }
        }

        std::cerr << "[FallbackRateService] All rate sources failed" << std::endl;
        throw domain::RateProviderException("All rate sources failed: " + lastError);
    }

    bool refreshIfStale(const domain::Timestamp& now) override {
        if (!hasStaleEntries(now)) {
            return false;
        }
        std::cout << "[FallbackRateService] Stale rates detected, refreshing" << std::endl;
        refresh();
        return true;
    }

    bool hasStaleEntries(const domain::Timestamp& now) const {
        for (const auto& point : table_->snapshot()) {
            if (isStale(point, now)) {
                return true;
            }
        }
        return false;
    }

    bool isStale(const domain::RatePoint& point, const domain::Timestamp& now) const {
        return point.lastUpdated.secondsUntil(now) > settings_->getMaxAgeSeconds();
    }

    /**
     * @brief Сколько раз курс менялся сильнее порога
     */
    size_t significantChangeCount() const {
        return significantChanges_.load();
    }

    /**
     * @brief Базовая константа для пары
     */
    static std::optional<double> baselineRate(domain::Currency from, domain::Currency to) {
        const auto& rates = baselineRates();
        auto it = rates.find({from, to});
        if (it == rates.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::shared_ptr<ports::output::IFallbackRateTable> table_;
    std::shared_ptr<ports::output::IRateSourceChain> sourceChain_;
    std::shared_ptr<settings::IFallbackRateSettings> settings_;
    std::mutex refreshMutex_;
    std::atomic<size_t> significantChanges_{0};

    /**
     * @brief Базовые курсы: по одной опорной величине на пару, обратное направление 1/R
     */
    static const std::map<std::pair<domain::Currency, domain::Currency>, double>& baselineRates() {
        using domain::Currency;
        static const std::map<std::pair<Currency, Currency>, double> rates = [] {
            const std::vector<std::tuple<Currency, Currency, double>> anchors = {
                {Currency::USD, Currency::NGN, 476.19},
                {Currency::EUR, Currency::NGN, 517.60},
                {Currency::GBP, Currency::NGN, 602.41},
                {Currency::EUR, Currency::USD, 1.09},
                {Currency::GBP, Currency::USD, 1.27},
                {Currency::GBP, Currency::EUR, 1.16},
            };
            std::map<std::pair<Currency, Currency>, double> table;
            for (const auto& [from, to, rate] : anchors) {
                table[{from, to}] = rate;
                table[{to, from}] = 1.0 / rate;
            }
            return table;
        }();
        return rates;
    }

    void seedBaseline() {
        auto now = domain::Timestamp::now();
        for (const auto& [pair, rate] : baselineRates()) {
            if (!table_->find(pair.first, pair.second)) {
                table_->put(domain::RatePoint(pair.first, pair.second, rate, now, "baseline"));
            }
        }
    }

    std::vector<domain::RatePoint> validRates(
        const std::vector<domain::RatePoint>& points,
        const std::string& sourceName) const
    {
        std::vector<domain::RatePoint> valid;
        for (const auto& point : points) {
            if (point.fromCurrency == point.toCurrency) {
                continue;
            }
            if (!domain::isValidRate(point.rate)) {
                std::cerr << "[FallbackRateService] Invalid rate from " << sourceName << " for "
                          << domain::toString(point.fromCurrency) << "/"
                          << domain::toString(point.toCurrency) << ": " << point.rate << std::endl;
                continue;
            }
            valid.push_back(point);
        }
        return valid;
    }

    /**
     * @brief Записать курсы и обратные к ним
     *
     * Каждая неупорядоченная пара пишется один раз за цикл: если источник
     * прислал оба направления, обратное берётся из первого, чтобы в
     * таблице было ровно (A,B) = R и (B,A) = 1/R.
     */
    void applyRates(const std::vector<domain::RatePoint>& points, const std::string& sourceName) {
        auto now = domain::Timestamp::now();
        std::set<std::pair<domain::Currency, domain::Currency>> written;

        for (const auto& point : points) {
            auto forward = std::make_pair(point.fromCurrency, point.toCurrency);
            auto backward = std::make_pair(point.toCurrency, point.fromCurrency);
            if (written.count(forward) || written.count(backward)) {
                continue;
            }

            monitorChange(point);

            table_->put(domain::RatePoint(
                point.fromCurrency, point.toCurrency, point.rate, now, sourceName));
            table_->put(domain::RatePoint(
                point.toCurrency, point.fromCurrency, 1.0 / point.rate, now, sourceName));

            written.insert(forward);
        }
    }

    void monitorChange(const domain::RatePoint& point) {
        auto current = table_->find(point.fromCurrency, point.toCurrency);
        if (!current || current->rate <= 0.0) {
            return;
        }

        double changePercent = (point.rate - current->rate) / current->rate * 100.0;
        if (std::fabs(changePercent) > settings_->getChangeAlertPercent()) {
            ++significantChanges_;
            std::cerr << "[FallbackRateService] Significant market rate change detected for "
                      << domain::toString(point.fromCurrency) << "/"
                      << domain::toString(point.toCurrency) << ": "
                      << current->rate << " -> " << point.rate
                      << " (" << changePercent << "% change)" << std::endl;
        }
    }
};

} // namespace wallet::application
