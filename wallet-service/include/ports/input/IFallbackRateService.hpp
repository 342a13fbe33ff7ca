#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/Currency.hpp"

namespace wallet::ports::input {

/**
 * @brief Интерфейс сервиса резервных курсов
 */
class IFallbackRateService {
public:
    virtual ~IFallbackRateService() = default;

    /**
     * @brief Курс из резервной таблицы (базовая константа, если пары нет)
     */
    virtual double getRate(domain::Currency from, domain::Currency to) = 0;

    /**
     * @brief Один цикл обновления по цепочке источников
     * @throws domain::RateProviderException если все источники отказали
     */
    virtual void refresh() = 0;

    /**
     * @brief Обновить, если хотя бы одна точка устарела на момент now
     * @return true если цикл выполнялся
     */
    virtual bool refreshIfStale(const domain::Timestamp& now) = 0;
};

} // namespace wallet::ports::input
