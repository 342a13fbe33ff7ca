#pragma once

#include <string>

namespace wallet::ports::output {

/**
 * @brief Интерфейс для публикации событий
 *
 * Реализуется RabbitMQEventPublisher.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "ledger.trade")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace wallet::ports::output
