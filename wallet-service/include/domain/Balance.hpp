#pragma once

#include "Decimal.hpp"
#include "BalanceKey.hpp"
#include "Timestamp.hpp"
#include "enums/Currency.hpp"
#include <string>

namespace wallet::domain {

/**
 * @brief Баланс одного владельца в одной валюте
 *
 * Три поля:
 * - total: всего средств
 * - locked: заблокировано (не участвует в операциях)
 * - available: доступно для списания
 *
 * Инвариант: total == locked + available, available >= 0.
 *
 * Баланс создаётся лениво с нулями при первом обращении к паре
 * (owner, currency) и никогда не удаляется. Изменяется только внутри
 * эксклюзивного захвата (IBalanceStore::withExclusiveHold).
 *
 * @example
 * ```
 * Начало: total=1000, locked=0, available=1000
 *
 * debit(100)  → total=900,  available=900
 * credit(85)  → total=985,  available=985
 * debit(5000) → false, баланс не изменился
 * ```
 */
struct Balance {
    std::string ownerId;                ///< Идентификатор владельца
    Currency currency = Currency::NGN;  ///< Валюта
    Decimal total;                      ///< Всего
    Decimal locked;                     ///< Заблокировано
    Decimal available;                  ///< Доступно
    Timestamp updatedAt;                ///< Время последнего изменения

    Balance() = default;

    Balance(std::string owner, Currency cur)
        : ownerId(std::move(owner)), currency(cur) {}

    BalanceKey key() const {
        return BalanceKey(ownerId, currency);
    }

    /**
     * @brief Проверить инвариант total == locked + available, available >= 0
     */
    bool isConsistent() const {
        return total == locked + available &&
               !available.isNegative() &&
               !locked.isNegative();
    }

    bool canDebit(const Decimal& amount) const {
        return available >= amount;
    }

    /**
     * @brief Зачислить средства: total += amount, available += amount
     */
    void credit(const Decimal& amount) {
        total += amount;
        available += amount;
        updatedAt = Timestamp::now();
    }

    /**
     * @brief Списать средства: total -= amount, available -= amount
     * @return false если available < amount (баланс не изменён)
     */
    bool debit(const Decimal& amount) {
        if (!canDebit(amount)) {
            return false;
        }
        total -= amount;
        available -= amount;
        updatedAt = Timestamp::now();
        return true;
    }
};

} // namespace wallet::domain
