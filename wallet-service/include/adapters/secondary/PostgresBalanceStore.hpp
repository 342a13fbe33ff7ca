// include/adapters/secondary/PostgresBalanceStore.hpp
#pragma once

#include "ports/output/IBalanceStore.hpp"
#include "settings/DbSettings.hpp"
#include "domain/LedgerError.hpp"
#include <pqxx/pqxx>
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace wallet::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища балансов
 *
 * Таблица: wallet_balances
 * - owner_id VARCHAR(64), currency VARCHAR(3)  PRIMARY KEY (owner_id, currency)
 * - total / locked / available NUMERIC(38,9)
 * - CHECK (total = locked + available), CHECK (available >= 0)
 *
 * Таблица: wallet_ledger_entries
 * - seq BIGSERIAL задаёт порядок истории (новые первыми: seq DESC)
 *
 * Эксклюзивный захват = одна транзакция:
 * 1. SET LOCAL lock_timeout
 * 2. INSERT .. ON CONFLICT DO NOTHING для недостающих балансов
 * 3. SELECT .. FOR UPDATE по каждому ключу в каноническом порядке
 * 4. fn над копиями, затем UPDATE балансов и INSERT записей журнала
 * 5. COMMIT; любое исключение до commit откатывает транзакцию
 *
 * Ошибки: lock_not_available (55P03) → HoldTimeout,
 * нарушение ограничений (23xxx) → StorageException(retryable=false),
 * прочие ошибки соединения и SQL → StorageException(retryable=true).
 */
class PostgresBalanceStore : public ports::output::IBalanceStore {
public:
    explicit PostgresBalanceStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    domain::Balance getOrCreate(const std::string& ownerId, domain::Currency currency) override {
        return run("getOrCreate", [&]() {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            domain::BalanceKey key(ownerId, currency);
            ensureRow(txn, key);
            auto result = txn.exec_params(
                "SELECT owner_id, currency, total, locked, available, "
                "EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_at "
                "FROM wallet_balances WHERE owner_id = $1 AND currency = $2",
                ownerId, domain::toString(currency));
            txn.commit();

            return parseBalance(result[0]);
        });
    }

    void withExclusiveHold(
        const std::vector<domain::BalanceKey>& keys,
        const HoldFunction& fn,
        std::chrono::milliseconds timeout) override
    {
        std::set<domain::BalanceKey> ordered(keys.begin(), keys.end());

        run("withExclusiveHold", [&]() {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec("SET LOCAL lock_timeout = '" + std::to_string(timeout.count()) + "ms'");

            for (const auto& key : ordered) {
                ensureRow(txn, key);
            }

            Hold hold;
            for (const auto& key : ordered) {
                auto result = txn.exec_params(
                    "SELECT owner_id, currency, total, locked, available, "
                    "EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_at "
                    "FROM wallet_balances WHERE owner_id = $1 AND currency = $2 "
                    "FOR UPDATE",
                    key.ownerId, domain::toString(key.currency));
                hold.working.emplace(key, parseBalance(result[0]));
            }

            fn(hold);

            for (const auto& [key, balance] : hold.working) {
                txn.exec_params(
                    "UPDATE wallet_balances "
                    "SET total = $3, locked = $4, available = $5, updated_at = NOW() "
                    "WHERE owner_id = $1 AND currency = $2",
                    key.ownerId, domain::toString(key.currency),
                    balance.total.toString(), balance.locked.toString(), balance.available.toString());
            }

            for (const auto& entry : hold.staged) {
                insertEntry(txn, entry);
            }

            txn.commit();
        });
    }

    void appendEntry(const domain::LedgerEntry& entry) override {
        run("appendEntry", [&]() {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);
            insertEntry(txn, entry);
            txn.commit();
        });
    }

    std::vector<domain::Balance> findBalances(const std::string& ownerId) override {
        return run("findBalances", [&]() {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT owner_id, currency, total, locked, available, "
                "EXTRACT(EPOCH FROM updated_at)::BIGINT AS updated_at "
                "FROM wallet_balances WHERE owner_id = $1 ORDER BY currency",
                ownerId);

            std::vector<domain::Balance> balances;
            for (const auto& row : result) {
                balances.push_back(parseBalance(row));
            }
            return balances;
        });
    }

    std::vector<domain::LedgerEntry> findEntries(
        const std::string& ownerId, size_t limit, size_t offset) override
    {
        return run("findEntries", [&]() {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                ENTRY_COLUMNS +
                "WHERE owner_id = $1 ORDER BY seq DESC LIMIT $2 OFFSET $3",
                ownerId, static_cast<int64_t>(limit), static_cast<int64_t>(offset));
            return parseEntries(result);
        });
    }

    size_t countEntries(const std::string& ownerId) override {
        return run("countEntries", [&]() {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT COUNT(*) FROM wallet_ledger_entries WHERE owner_id = $1",
                ownerId);
            return static_cast<size_t>(result[0][0].as<int64_t>());
        });
    }

    std::vector<domain::LedgerEntry> findEntriesByKind(
        const std::string& ownerId, domain::LedgerEntryKind kind) override
    {
        return run("findEntriesByKind", [&]() {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                ENTRY_COLUMNS +
                "WHERE owner_id = $1 AND kind = $2 ORDER BY seq DESC",
                ownerId, domain::toString(kind));
            return parseEntries(result);
        });
    }

private:
    inline static const std::string ENTRY_COLUMNS =
        "SELECT id, owner_id, kind, status, from_currency, to_currency, "
        "amount, rate, converted_amount, counterparty_id, reference, description, "
        "EXTRACT(EPOCH FROM created_at)::BIGINT AS created_at "
        "FROM wallet_ledger_entries ";

    class Hold : public ports::output::BalanceHold {
    public:
        std::map<domain::BalanceKey, domain::Balance> working;
        std::vector<domain::LedgerEntry> staged;

        domain::Balance& balance(const domain::BalanceKey& key) override {
            auto it = working.find(key);
            if (it == working.end()) {
                throw std::out_of_range("Balance " + key.toString() + " is not held");
            }
            return it->second;
        }

        void record(const domain::LedgerEntry& entry) override {
            staged.push_back(entry);
        }
    };

    std::shared_ptr<settings::DbSettings> settings_;

    /**
     * @brief Перевести ошибки libpqxx в доменные
     *
     * Исключения, брошенные функцией захвата, проходят без изменений.
     */
    template <typename Operation>
    auto run(const char* operation, Operation&& op) -> std::invoke_result_t<Operation&> {
        try {
            return op();
        } catch (const pqxx::sql_error& e) {
            std::cerr << "[PostgresBalanceStore] " << operation << " error: " << e.what()
                      << " (sqlstate " << e.sqlstate() << ")" << std::endl;
            if (e.sqlstate() == "55P03") {
                throw domain::LedgerException(
                    domain::LedgerErrorCode::HoldTimeout,
                    "Could not acquire balance hold: lock timeout");
            }
            bool constraintViolation = e.sqlstate().rfind("23", 0) == 0;
            throw domain::StorageException(e.what(), !constraintViolation);
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresBalanceStore] " << operation << " connection error: "
                      << e.what() << std::endl;
            throw domain::StorageException(e.what(), true);
        } catch (const pqxx::failure& e) {
            std::cerr << "[PostgresBalanceStore] " << operation << " error: " << e.what() << std::endl;
            throw domain::StorageException(e.what(), true);
        }
    }

    static void ensureRow(pqxx::work& txn, const domain::BalanceKey& key) {
        txn.exec_params(
            "INSERT INTO wallet_balances (owner_id, currency) VALUES ($1, $2) "
            "ON CONFLICT (owner_id, currency) DO NOTHING",
            key.ownerId, domain::toString(key.currency));
    }

    static void insertEntry(pqxx::work& txn, const domain::LedgerEntry& entry) {
        txn.exec_params(
            "INSERT INTO wallet_ledger_entries "
            "(id, owner_id, kind, status, from_currency, to_currency, amount, rate, "
            " converted_amount, counterparty_id, reference, description, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, to_timestamp($13))",
            entry.id,
            entry.ownerId,
            domain::toString(entry.kind),
            domain::toString(entry.status),
            domain::toString(entry.fromCurrency),
            domain::toString(entry.toCurrency),
            entry.amount.toString(),
            entry.rate.toString(),
            entry.convertedAmount.toString(),
            entry.counterpartyId ? entry.counterpartyId->c_str() : nullptr,
            entry.reference ? entry.reference->c_str() : nullptr,
            entry.description,
            entry.createdAt.toUnixSeconds());
    }

    static domain::Balance parseBalance(const pqxx::row& row) {
        domain::Balance balance(
            row["owner_id"].as<std::string>(),
            domain::currencyFromString(row["currency"].as<std::string>()));
        balance.total = domain::Decimal::fromString(row["total"].as<std::string>());
        balance.locked = domain::Decimal::fromString(row["locked"].as<std::string>());
        balance.available = domain::Decimal::fromString(row["available"].as<std::string>());
        balance.updatedAt = domain::Timestamp::fromUnixSeconds(row["updated_at"].as<int64_t>());
        return balance;
    }

    static std::vector<domain::LedgerEntry> parseEntries(const pqxx::result& result) {
        std::vector<domain::LedgerEntry> entries;
        for (const auto& row : result) {
            domain::LedgerEntry entry;
            entry.id = row["id"].as<std::string>();
            entry.ownerId = row["owner_id"].as<std::string>();
            entry.kind = domain::ledgerEntryKindFromString(row["kind"].as<std::string>());
            entry.status = domain::ledgerEntryStatusFromString(row["status"].as<std::string>());
            entry.fromCurrency = domain::currencyFromString(row["from_currency"].as<std::string>());
            entry.toCurrency = domain::currencyFromString(row["to_currency"].as<std::string>());
            entry.amount = domain::Decimal::fromString(row["amount"].as<std::string>());
            entry.rate = domain::Decimal::fromString(row["rate"].as<std::string>());
            entry.convertedAmount = domain::Decimal::fromString(row["converted_amount"].as<std::string>());
            if (!row["counterparty_id"].is_null()) {
                entry.counterpartyId = row["counterparty_id"].as<std::string>();
            }
            if (!row["reference"].is_null()) {
                entry.reference = row["reference"].as<std::string>();
            }
            entry.description = row["description"].is_null() ? "" : row["description"].as<std::string>();
            entry.createdAt = domain::Timestamp::fromUnixSeconds(row["created_at"].as<int64_t>());
            entries.push_back(entry);
        }
        return entries;
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS wallet_balances (
                    owner_id VARCHAR(64) NOT NULL,
                    currency VARCHAR(3) NOT NULL,
                    total NUMERIC(38, 9) NOT NULL DEFAULT 0,
                    locked NUMERIC(38, 9) NOT NULL DEFAULT 0,
                    available NUMERIC(38, 9) NOT NULL DEFAULT 0,
                    updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                    PRIMARY KEY (owner_id, currency),
                    CONSTRAINT wallet_balances_split CHECK (total = locked + available),
                    CONSTRAINT wallet_balances_available_non_negative CHECK (available >= 0),
                    CONSTRAINT wallet_balances_locked_non_negative CHECK (locked >= 0)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS wallet_ledger_entries (
                    seq BIGSERIAL,
                    id VARCHAR(36) PRIMARY KEY,
                    owner_id VARCHAR(64) NOT NULL,
                    kind VARCHAR(16) NOT NULL,
                    status VARCHAR(16) NOT NULL,
                    from_currency VARCHAR(3) NOT NULL,
                    to_currency VARCHAR(3) NOT NULL,
                    amount NUMERIC(38, 9) NOT NULL,
                    rate NUMERIC(38, 9) NOT NULL,
                    converted_amount NUMERIC(38, 9) NOT NULL,
                    counterparty_id VARCHAR(64),
                    reference VARCHAR(255),
                    description TEXT,
                    created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
                )
            )");

            txn.exec(R"(
                CREATE INDEX IF NOT EXISTS idx_wallet_ledger_owner_seq
                ON wallet_ledger_entries (owner_id, seq DESC)
            )");

            txn.commit();
            std::cout << "[PostgresBalanceStore] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresBalanceStore] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace wallet::adapters::secondary
