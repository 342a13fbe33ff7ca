#pragma once

#include "ports/output/IBalanceStore.hpp"
#include "domain/LedgerError.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace wallet::adapters::secondary {

/**
 * @brief In-memory хранилище балансов
 *
 * Каждый ключ (owner, currency) имеет свой слот с timed_mutex.
 * Слоты создаются лениво через ThreadSafeMap::getOrCreate, поэтому
 * конкурентные обращения к новому ключу получают один и тот же слот.
 *
 * withExclusiveHold:
 * 1. Ключи сортируются (BalanceKey::operator<) и захватываются по одному
 *    с общим дедлайном timeout
 * 2. fn работает с копиями балансов
 * 3. Только если fn завершился без исключения и инварианты выполнены,
 *    копии записываются в слоты, а записи журнала добавляются в историю
 *
 * Захваты с непересекающимися ключами идут параллельно.
 */
class InMemoryBalanceStore : public ports::output::IBalanceStore {
public:
    InMemoryBalanceStore() {
        std::cout << "[InMemoryBalanceStore] Created" << std::endl;
    }

    domain::Balance getOrCreate(const std::string& ownerId, domain::Currency currency) override {
        auto slot = slotFor(domain::BalanceKey(ownerId, currency));
        std::lock_guard<std::timed_mutex> lock(slot->mutex);
        return slot->balance;
    }

    void withExclusiveHold(
        const std::vector<domain::BalanceKey>& keys,
        const HoldFunction& fn,
        std::chrono::milliseconds timeout) override
    {
        std::set<domain::BalanceKey> ordered(keys.begin(), keys.end());
        auto deadline = std::chrono::steady_clock::now() + timeout;

        std::vector<std::shared_ptr<Slot>> slots;
        std::vector<std::unique_lock<std::timed_mutex>> locks;

        for (const auto& key : ordered) {
            auto slot = slotFor(key);
            std::unique_lock<std::timed_mutex> lock(slot->mutex, std::defer_lock);
            if (!lock.try_lock_until(deadline)) {
                std::cerr << "[InMemoryBalanceStore] Hold timeout on " << key.toString() << std::endl;
                throw domain::LedgerException(
                    domain::LedgerErrorCode::HoldTimeout,
                    "Could not acquire hold on " + key.toString() + " within " +
                    std::to_string(timeout.count()) + "ms");
            }
            locks.push_back(std::move(lock));
            slots.push_back(slot);
        }

        Hold hold;
        for (const auto& slot : slots) {
            hold.working.emplace(slot->balance.key(), slot->balance);
        }

        fn(hold);

        for (const auto& [key, balance] : hold.working) {
            if (!balance.isConsistent()) {
                throw domain::StorageException(
                    "Balance invariant violated for " + key.toString(), false);
            }
        }

        for (const auto& slot : slots) {
            slot->balance = hold.working.at(slot->balance.key());
        }

        if (!hold.staged.empty()) {
            std::lock_guard<std::mutex> lock(entriesMutex_);
            entries_.insert(entries_.end(), hold.staged.begin(), hold.staged.end());
        }
    }

    void appendEntry(const domain::LedgerEntry& entry) override {
        std::lock_guard<std::mutex> lock(entriesMutex_);
        entries_.push_back(entry);
    }

    std::vector<domain::Balance> findBalances(const std::string& ownerId) override {
        std::vector<domain::Balance> result;
        for (const auto& slot : slots_.values()) {
            std::lock_guard<std::timed_mutex> lock(slot->mutex);
            if (slot->balance.ownerId == ownerId) {
                result.push_back(slot->balance);
            }
        }

        std::sort(result.begin(), result.end(),
            [](const domain::Balance& a, const domain::Balance& b) {
                return a.key() < b.key();
            });
        return result;
    }

    std::vector<domain::LedgerEntry> findEntries(
        const std::string& ownerId, size_t limit, size_t offset) override
    {
        std::lock_guard<std::mutex> lock(entriesMutex_);
        std::vector<domain::LedgerEntry> result;
        size_t skipped = 0;

        // Новые первыми: история хранится в порядке добавления
        for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
            if (it->ownerId != ownerId) {
                continue;
            }
            if (skipped < offset) {
                ++skipped;
                continue;
            }
            result.push_back(*it);
        }
        return result;
    }

    size_t countEntries(const std::string& ownerId) override {
        std::lock_guard<std::mutex> lock(entriesMutex_);
        return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
            [&ownerId](const domain::LedgerEntry& e) { return e.ownerId == ownerId; }));
    }

    std::vector<domain::LedgerEntry> findEntriesByKind(
        const std::string& ownerId, domain::LedgerEntryKind kind) override
    {
        std::lock_guard<std::mutex> lock(entriesMutex_);
        std::vector<domain::LedgerEntry> result;
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (it->ownerId == ownerId && it->kind == kind) {
                result.push_back(*it);
            }
        }
        return result;
    }

private:
    struct Slot {
        std::timed_mutex mutex;
        domain::Balance balance;
    };

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

    ThreadSafeMap<std::string, Slot> slots_;
    std::mutex entriesMutex_;
    std::vector<domain::LedgerEntry> entries_;

    std::shared_ptr<Slot> slotFor(const domain::BalanceKey& key) {
        return slots_.getOrCreate(key.toString(), [&key]() {
            auto slot = std::make_shared<Slot>();
            slot->balance = domain::Balance(key.ownerId, key.currency);
            return slot;
        });
    }
};

} // namespace wallet::adapters::secondary
