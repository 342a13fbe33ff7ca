#pragma once

#include "enums/Currency.hpp"
#include <string>
#include <tuple>

namespace wallet::domain {

/**
 * @brief Ключ баланса: (владелец, валюта)
 *
 * operator< задаёт канонический порядок захвата: сначала по владельцу,
 * затем по ISO-коду валюты. Все операции, которым нужно несколько
 * ключей, захватывают их строго в этом порядке.
 */
struct BalanceKey {
    std::string ownerId;
    Currency currency = Currency::NGN;

    BalanceKey() = default;

    BalanceKey(std::string owner, Currency cur)
        : ownerId(std::move(owner)), currency(cur) {}

    /**
     * @brief Строковое представление "owner/CUR"
     */
    std::string toString() const {
        return ownerId + "/" + domain::toString(currency);
    }

    bool operator<(const BalanceKey& other) const {
        return std::make_tuple(ownerId, domain::toString(currency)) <
               std::make_tuple(other.ownerId, domain::toString(other.currency));
    }

    bool operator==(const BalanceKey& other) const {
        return ownerId == other.ownerId && currency == other.currency;
    }

    bool operator!=(const BalanceKey& other) const { return !(*this == other); }
};

} // namespace wallet::domain
