#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include "enums/Currency.hpp"
#include "enums/LedgerEntryKind.hpp"
#include "enums/LedgerEntryStatus.hpp"
#include <string>
#include <optional>

namespace wallet::domain {

/**
 * @brief Запись журнала операций (неизменяемая история)
 *
 * Создаётся только LedgerService и записывается атомарно вместе с
 * изменением балансов (COMPLETED) либо отдельно как аудит отказа (FAILED).
 * После записи в хранилище не изменяется.
 *
 * Для FUNDING и TRANSFER: fromCurrency == toCurrency, rate = 1,
 * convertedAmount = amount.
 */
struct LedgerEntry {
    std::string id;
    std::string ownerId;                        ///< Кому принадлежит запись (для TRANSFER отправитель)
    LedgerEntryKind kind = LedgerEntryKind::FUNDING;
    LedgerEntryStatus status = LedgerEntryStatus::PENDING;
    Currency fromCurrency = Currency::NGN;
    Currency toCurrency = Currency::NGN;
    Decimal amount;                             ///< Исходная сумма в fromCurrency
    Decimal rate = Decimal::fromUnits(1);       ///< Применённый курс
    Decimal convertedAmount;                    ///< amount * rate в toCurrency
    std::optional<std::string> counterpartyId;  ///< Получатель перевода
    std::optional<std::string> reference;       ///< Внешняя ссылка (пополнение)
    std::string description;
    Timestamp createdAt;
};

} // namespace wallet::domain
