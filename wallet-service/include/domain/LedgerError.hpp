#pragma once

#include <stdexcept>
#include <string>

namespace wallet::domain {

/**
 * @brief Коды ошибок операций с кошельком
 *
 * Классы ошибок:
 * - валидация (InvalidAmount, SameOwner, SameCurrency, UnsupportedCurrency)
 *   отклоняется до захвата балансов
 * - доступ (OwnerNotEligible) отклоняется до захвата балансов
 * - состояние (InsufficientFunds) обнаруживается под захватом
 * - зависимости (RateUnavailable, HoldTimeout, StorageUnavailable)
 *   можно повторить целиком на стороне клиента
 */
enum class LedgerErrorCode {
    InvalidAmount,
    OwnerNotEligible,
    SameOwner,
    SameCurrency,
    UnsupportedCurrency,
    InsufficientFunds,
    RateUnavailable,
    HoldTimeout,
    StorageUnavailable,
    Internal
};

inline std::string toString(LedgerErrorCode code) {
    switch (code) {
        case LedgerErrorCode::InvalidAmount:       return "INVALID_AMOUNT";
        case LedgerErrorCode::OwnerNotEligible:    return "OWNER_NOT_ELIGIBLE";
        case LedgerErrorCode::SameOwner:           return "SAME_OWNER";
        case LedgerErrorCode::SameCurrency:        return "SAME_CURRENCY";
        case LedgerErrorCode::UnsupportedCurrency: return "UNSUPPORTED_CURRENCY";
        case LedgerErrorCode::InsufficientFunds:   return "INSUFFICIENT_FUNDS";
        case LedgerErrorCode::RateUnavailable:     return "RATE_UNAVAILABLE";
        case LedgerErrorCode::HoldTimeout:         return "HOLD_TIMEOUT";
        case LedgerErrorCode::StorageUnavailable:  return "STORAGE_UNAVAILABLE";
        case LedgerErrorCode::Internal:            return "INTERNAL";
    }
    return "INTERNAL";
}

/**
 * @brief Ошибка операции с кошельком
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(LedgerErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    LedgerErrorCode code() const { return code_; }

    /**
     * @brief Можно ли повторить операцию целиком
     */
    bool isRetryable() const {
        return code_ == LedgerErrorCode::RateUnavailable ||
               code_ == LedgerErrorCode::HoldTimeout ||
               code_ == LedgerErrorCode::StorageUnavailable;
    }

private:
    LedgerErrorCode code_;
};

/**
 * @brief Ошибка внешнего источника курсов
 */
class RateProviderException : public std::runtime_error {
public:
    explicit RateProviderException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Ошибка хранилища балансов
 *
 * retryable = true для временных сбоев ввода-вывода (соединение, блокировка),
 * false для нарушения ограничений и повреждения данных.
 */
class StorageException : public std::runtime_error {
public:
    StorageException(const std::string& message, bool retryable)
        : std::runtime_error(message), retryable_(retryable) {}

    bool isRetryable() const { return retryable_; }

private:
    bool retryable_;
};

} // namespace wallet::domain
