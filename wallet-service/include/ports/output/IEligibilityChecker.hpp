#pragma once

#include <string>

namespace wallet::ports::output {

/**
 * @brief Проверка, что владелец может выполнять операции
 *
 * Реализуется HttpEligibilityChecker (запрос к auth-service).
 */
class IEligibilityChecker {
public:
    virtual ~IEligibilityChecker() = default;

    /**
     * @return true если пользователь существует и подтвердил email
     */
    virtual bool isEligible(const std::string& ownerId) = 0;

    /**
     * @return true если пользователь существует (подтверждение не требуется)
     *
     * Используется для получателя перевода.
     */
    virtual bool exists(const std::string& ownerId) = 0;
};

} // namespace wallet::ports::output
