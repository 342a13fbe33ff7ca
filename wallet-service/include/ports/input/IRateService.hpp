#pragma once

#include "domain/ConversionQuote.hpp"
#include "domain/RateTable.hpp"
#include "domain/enums/Currency.hpp"
#include <string>

namespace wallet::ports::input {

/**
 * @brief Интерфейс сервиса курсов
 *
 * Ошибки живого провайдера после исчерпания повторов отдаются как
 * domain::LedgerException(RateUnavailable).
 */
class IRateService {
public:
    virtual ~IRateService() = default;

    /**
     * @brief Полная живая таблица курсов (через кэш)
     */
    virtual domain::RateTable getRates(const std::string& base) = 0;

    /**
     * @brief Котировка конвертации по живому курсу
     */
    virtual domain::ConversionQuote convert(
        domain::Currency from,
        domain::Currency to,
        const domain::Decimal& amount) = 0;

    /**
     * @brief Курс для пары
     * @param allowFallback разрешить резервную таблицу при отказе живого источника
     */
    virtual domain::ResolvedRate resolveRate(
        domain::Currency from,
        domain::Currency to,
        bool allowFallback) = 0;
};

} // namespace wallet::ports::input
