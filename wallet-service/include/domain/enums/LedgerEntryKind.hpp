#pragma once

#include <string>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Вид движения денег
 */
enum class LedgerEntryKind {
    FUNDING,    ///< Пополнение кошелька
    TRANSFER,   ///< Перевод другому пользователю
    TRADE       ///< Обмен валюты по курсу
};

inline std::string toString(LedgerEntryKind kind) {
    switch (kind) {
        case LedgerEntryKind::FUNDING:  return "FUNDING";
        case LedgerEntryKind::TRANSFER: return "TRANSFER";
        case LedgerEntryKind::TRADE:    return "TRADE";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline LedgerEntryKind ledgerEntryKindFromString(const std::string& str) {
    if (str == "FUNDING")  return LedgerEntryKind::FUNDING;
    if (str == "TRANSFER") return LedgerEntryKind::TRANSFER;
    if (str == "TRADE")    return LedgerEntryKind::TRADE;
    throw std::invalid_argument("Unknown LedgerEntryKind: " + str);
}

/**
 * @brief Routing key уведомления для вида операции
 */
inline std::string routingKeyFor(LedgerEntryKind kind) {
    switch (kind) {
        case LedgerEntryKind::FUNDING:  return "ledger.funding";
        case LedgerEntryKind::TRANSFER: return "ledger.transfer";
        case LedgerEntryKind::TRADE:    return "ledger.trade";
    }
    return "ledger.unknown";
}

} // namespace wallet::domain
