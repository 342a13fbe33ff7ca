#pragma once

#include "domain/Balance.hpp"
#include "domain/BalanceKey.hpp"
#include "domain/LedgerEntry.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace wallet::ports::output {

/**
 * @brief Рабочий набор балансов внутри эксклюзивного захвата
 *
 * balance() отдаёт изменяемую копию; изменения и записи журнала,
 * переданные в record(), применяются только если функция захвата
 * завершилась без исключения.
 */
class BalanceHold {
public:
    virtual ~BalanceHold() = default;

    /**
     * @brief Захваченный баланс по ключу
     * @throws std::out_of_range если ключ не входит в захват
     */
    virtual domain::Balance& balance(const domain::BalanceKey& key) = 0;

    /**
     * @brief Записать запись журнала в той же атомарной фиксации
     */
    virtual void record(const domain::LedgerEntry& entry) = 0;
};

/**
 * @brief Хранилище балансов и журнала операций
 *
 * Реализуется InMemoryBalanceStore и PostgresBalanceStore.
 */
class IBalanceStore {
public:
    using HoldFunction = std::function<void(BalanceHold&)>;

    virtual ~IBalanceStore() = default;

    /**
     * @brief Получить баланс, создав нулевой при первом обращении
     *
     * Идемпотентно, не создаёт дубликатов при конкурентных вызовах.
     */
    virtual domain::Balance getOrCreate(const std::string& ownerId, domain::Currency currency) = 0;

    /**
     * @brief Выполнить fn под эксклюзивным захватом всех ключей
     *
     * Ключи дедуплицируются и захватываются в каноническом порядке
     * (BalanceKey::operator<). Недостающие балансы создаются нулевыми.
     * Если fn бросает исключение, все изменения отбрасываются и
     * исключение пробрасывается дальше.
     *
     * @throws domain::LedgerException (HoldTimeout) если захват не получен за timeout
     * @throws domain::StorageException при сбое хранилища
     */
    virtual void withExclusiveHold(
        const std::vector<domain::BalanceKey>& keys,
        const HoldFunction& fn,
        std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Записать отдельную запись журнала (аудит отказов)
     */
    virtual void appendEntry(const domain::LedgerEntry& entry) = 0;

    /**
     * @brief Все балансы владельца, отсортированные по коду валюты
     */
    virtual std::vector<domain::Balance> findBalances(const std::string& ownerId) = 0;

    /**
     * @brief Записи владельца, новые первыми
     */
    virtual std::vector<domain::LedgerEntry> findEntries(
        const std::string& ownerId, size_t limit, size_t offset) = 0;

    virtual size_t countEntries(const std::string& ownerId) = 0;

    virtual std::vector<domain::LedgerEntry> findEntriesByKind(
        const std::string& ownerId, domain::LedgerEntryKind kind) = 0;
};

} // namespace wallet::ports::output
