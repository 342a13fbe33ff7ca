#pragma once

#include "settings/IRetrySettings.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>

namespace wallet::application {

/**
 * @brief Повтор операции с экспоненциальной задержкой
 *
 * До maxAttempts попыток. Между попытками ждёт delay, который начинается
 * с initialDelay и умножается на backoffFactor, но не превышает maxDelay.
 * После последней неудачной попытки пробрасывает её исключение.
 *
 * @example (3 попытки, 1s, x2, max 5s)
 * ```
 * попытка 1 → ошибка → ждём 1000ms
 * попытка 2 → ошибка → ждём 2000ms
 * попытка 3 → успех
 * ```
 *
 * Ожидание блокирует только вызывающий поток.
 */
class RetryPolicy {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    explicit RetryPolicy(std::shared_ptr<settings::IRetrySettings> settings)
        : settings_(std::move(settings))
        , sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); })
    {
        std::cout << "[RetryPolicy] Created: attempts=" << settings_->getMaxAttempts()
                  << " initial=" << settings_->getInitialDelay().count() << "ms"
                  << " factor=" << settings_->getBackoffFactor()
                  << " max=" << settings_->getMaxDelay().count() << "ms" << std::endl;
    }

    /**
     * @brief Подменить ожидание (тесты)
     */
    void setSleepFunction(SleepFunction sleep) {
        sleep_ = std::move(sleep);
    }

    /**
     * @brief Выполнить operation с повторами
     * @param context Описание для логов ("fetching rates for USD")
     */
    template <typename Operation>
    auto execute(Operation&& operation, const std::string& context)
        -> std::invoke_result_t<Operation&>
    {
        const int maxAttempts = std::max(1, settings_->getMaxAttempts());
        auto delay = settings_->getInitialDelay();

        for (int attempt = 1; ; ++attempt) {
            try {
                return operation();
            } catch (const std::exception& e) {
                std::cerr << "[RetryPolicy] Attempt " << attempt << "/" << maxAttempts
                          << " failed for " << context << ": " << e.what() << std::endl;
                if (attempt >= maxAttempts) {
                    throw;
                }
            }

            sleep_(delay);
            delay = nextDelay(delay);
        }
    }

    std::chrono::milliseconds nextDelay(std::chrono::milliseconds current) const {
        auto next = std::chrono::milliseconds(static_cast<int64_t>(
            static_cast<double>(current.count()) * settings_->getBackoffFactor()));
        return std::min(next, settings_->getMaxDelay());
    }

private:
    std::shared_ptr<settings::IRetrySettings> settings_;
    SleepFunction sleep_;
};

} // namespace wallet::application
