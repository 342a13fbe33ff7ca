#pragma once

#include <string>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Статус записи журнала
 */
enum class LedgerEntryStatus {
    PENDING,    ///< Операция начата
    COMPLETED,  ///< Проведена, балансы изменены
    FAILED,     ///< Отклонена, балансы не изменены
    CANCELLED   ///< Отменена до проведения
};

inline std::string toString(LedgerEntryStatus status) {
    switch (status) {
        case LedgerEntryStatus::PENDING:   return "PENDING";
        case LedgerEntryStatus::COMPLETED: return "COMPLETED";
        case LedgerEntryStatus::FAILED:    return "FAILED";
        case LedgerEntryStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline LedgerEntryStatus ledgerEntryStatusFromString(const std::string& str) {
    if (str == "PENDING")   return LedgerEntryStatus::PENDING;
    if (str == "COMPLETED") return LedgerEntryStatus::COMPLETED;
    if (str == "FAILED")    return LedgerEntryStatus::FAILED;
    if (str == "CANCELLED") return LedgerEntryStatus::CANCELLED;
    throw std::invalid_argument("Unknown LedgerEntryStatus: " + str);
}

/**
 * @brief Запись в финальном статусе больше не изменяется
 */
inline bool isFinalStatus(LedgerEntryStatus status) {
    return status == LedgerEntryStatus::COMPLETED ||
           status == LedgerEntryStatus::FAILED ||
           status == LedgerEntryStatus::CANCELLED;
}

} // namespace wallet::domain
