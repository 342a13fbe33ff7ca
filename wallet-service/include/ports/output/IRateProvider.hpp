#pragma once

#include "domain/RateTable.hpp"
#include <string>

namespace wallet::ports::output {

/**
 * @brief Основной живой провайдер курсов
 *
 * Реализуется HttpExchangeRateProvider, кэшируется CachedRateProvider.
 */
class IRateProvider {
public:
    virtual ~IRateProvider() = default;

    /**
     * @brief Полная таблица курсов для базовой валюты
     * @throws domain::RateProviderException при сетевой ошибке или неверном ответе
     */
    virtual domain::RateTable fetchRates(const std::string& base) = 0;
};

} // namespace wallet::ports::output
