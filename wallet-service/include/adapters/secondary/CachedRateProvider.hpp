#pragma once

#include "ports/output/IRateProvider.hpp"
#include "adapters/secondary/HttpExchangeRateProvider.hpp"
#include "settings/CacheSettings.hpp"
#include <cache/ICache.hpp>
#include <cache/Cache.hpp>
#include <cache/eviction/LRUPolicy.hpp>
#include <cache/expiration/GlobalTTL.hpp>
#include <cache/concurrency/ThreadSafeCache.hpp>
#include <memory>
#include <iostream>

namespace wallet::adapters::secondary {

/**
 * @brief Декоратор IRateProvider с LRU + TTL кэшированием
 *
 * Ключ: "rates:{BASE}" -> последняя полная таблица курсов.
 * Кэшируются только успешные ответы; ошибка провайдера проходит насквозь.
 */
class CachedRateProvider : public ports::output::IRateProvider {
public:
    CachedRateProvider(
        std::shared_ptr<HttpExchangeRateProvider> delegate,
        std::shared_ptr<settings::CacheSettings> cacheSettings
    ) : delegate_(std::move(delegate))
      , cacheSettings_(std::move(cacheSettings))
    {
        initCache();
    }

    domain::RateTable fetchRates(const std::string& base) override {
        const std::string key = cacheKey(base);

        auto cached = ratesCache_->get(key);
        if (cached) {
            std::cout << "[CachedRateProvider] Cache hit for rates: " << base << std::endl;
            return *cached;
        }

        std::cout << "[CachedRateProvider] Cache miss for rates: " << base << std::endl;
        auto table = delegate_->fetchRates(base);
        ratesCache_->put(key, table);
        return table;
    }

    // ============================================
    // УПРАВЛЕНИЕ КЭШЕМ
    // ============================================

    void clearCache() {
        ratesCache_->clear();
    }

    size_t getCacheSize() const {
        return ratesCache_->size();
    }

    static std::string cacheKey(const std::string& base) {
        return "rates:" + base;
    }

private:
    void initCache() {
        size_t size = cacheSettings_->getRatesCacheSize();
        int ttlSeconds = cacheSettings_->getRatesTtlSeconds();

        auto base = std::make_unique<Cache<std::string, domain::RateTable>>(
            size,
            std::make_unique<LRUPolicy<std::string>>(),
            std::make_unique<GlobalTTL<std::string>>(std::chrono::seconds(ttlSeconds))
        );
        ratesCache_ = std::make_unique<ThreadSafeCache<std::string, domain::RateTable>>(
            std::move(base)
        );

        std::cout << "[CachedRateProvider] Created with ratesCache="
                  << size << "/" << ttlSeconds << "s" << std::endl;
    }

    std::shared_ptr<HttpExchangeRateProvider> delegate_;
    std::shared_ptr<settings::CacheSettings> cacheSettings_;
    std::unique_ptr<ICache<std::string, domain::RateTable>> ratesCache_;
};

} // namespace wallet::adapters::secondary
