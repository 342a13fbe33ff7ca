#pragma once

#include "domain/Balance.hpp"
#include "domain/Decimal.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/TransactionPage.hpp"
#include <string>
#include <vector>

namespace wallet::ports::input {

/**
 * @brief Интерфейс сервиса кошелька
 *
 * Все операции бросают domain::LedgerException с кодом ошибки.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Пополнить кошелёк
     */
    virtual domain::LedgerEntry fund(
        const std::string& ownerId,
        const domain::Decimal& amount,
        domain::Currency currency,
        const std::string& reference) = 0;

    /**
     * @brief Перевести средства другому пользователю в той же валюте
     */
    virtual domain::LedgerEntry transfer(
        const std::string& fromOwnerId,
        const std::string& toOwnerId,
        const domain::Decimal& amount,
        domain::Currency currency,
        const std::string& description) = 0;

    /**
     * @brief Обменять валюту по живому курсу
     */
    virtual domain::LedgerEntry trade(
        const std::string& ownerId,
        domain::Currency fromCurrency,
        domain::Currency toCurrency,
        const domain::Decimal& amount) = 0;

    virtual std::vector<domain::Balance> getBalances(const std::string& ownerId) = 0;

    virtual domain::TransactionPage getTransactions(
        const std::string& ownerId, size_t page, size_t limit) = 0;

    virtual std::vector<domain::LedgerEntry> getTransactionsByKind(
        const std::string& ownerId, domain::LedgerEntryKind kind) = 0;
};

} // namespace wallet::ports::input
