#pragma once

#include "domain/RatePoint.hpp"
#include "domain/enums/RateSourceKind.hpp"
#include <string>
#include <vector>

namespace wallet::ports::output {

/**
 * @brief Источник курсов для обновления резервной таблицы
 */
class IRateSource {
public:
    virtual ~IRateSource() = default;

    virtual domain::RateSourceKind kind() const = 0;

    /**
     * @brief Имя для логов ("Fixer API")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Лёгкая проверка доступности (ключ настроен, API отвечает)
     */
    virtual bool isAvailable() = 0;

    /**
     * @brief Все курсы источника в обоих направлениях
     * @throws domain::RateProviderException при ошибке
     */
    virtual std::vector<domain::RatePoint> getRates() = 0;
};

} // namespace wallet::ports::output
