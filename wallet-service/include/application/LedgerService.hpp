// wallet-service/include/application/LedgerService.hpp
#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/input/IRateService.hpp"
#include "ports/input/IFallbackRateService.hpp"
#include "ports/output/IBalanceStore.hpp"
#include "ports/output/IEligibilityChecker.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "settings/ILedgerSettings.hpp"
#include "domain/LedgerError.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <sstream>
#include <type_traits>
#include <vector>

namespace wallet::application {

/**
 * @brief Движок операций с кошельком
 *
 * Каждая операция проходит одни и те же шаги:
 * 1. Проверка владельца (IEligibilityChecker), до любого захвата;
 *    получатель перевода должен существовать
 * 2. Валидация входа (сумма > 0, разные владельцы/валюты)
 * 3. Эксклюзивный захват затронутых балансов в каноническом порядке
 * 4. Изменение балансов и запись LedgerEntry в той же фиксации
 * 5. Освобождение захвата, публикация уведомления
 *
 * Любое исключение на шаге 4 откатывает все изменения операции.
 * После отказа под захватом (нет средств, нет курса, таймаут захвата)
 * отдельно пишется FAILED запись для аудита; уведомление о ней уходит,
 * только если запись сохранена.
 *
 * Уведомления (ledger.funding / ledger.transfer / ledger.trade) не влияют
 * на результат: ошибка публикации только логируется.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<ports::output::IBalanceStore> store,
        std::shared_ptr<ports::input::IRateService> rateService,
        std::shared_ptr<ports::input::IFallbackRateService> fallbackRates,
        std::shared_ptr<ports::output::IEligibilityChecker> eligibility,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<settings::ILedgerSettings> settings
    ) : store_(std::move(store))
      , rateService_(std::move(rateService))
      , fallbackRates_(std::move(fallbackRates))
      , eligibility_(std::move(eligibility))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(std::move(settings))
    {
        std::cout << "[LedgerService] Created, holdTimeout="
                  << settings_->getHoldTimeout().count() << "ms" << std::endl;
    }

    // ============================================
    // ПОПОЛНЕНИЕ
    // ============================================

    domain::LedgerEntry fund(
        const std::string& ownerId,
        const domain::Decimal& amount,
        domain::Currency currency,
        const std::string& reference) override
    {
        requireEligible(ownerId);
        requirePositive(amount, "Funding amount must be positive");

        auto entry = newEntry(ownerId, domain::LedgerEntryKind::FUNDING, currency, currency, amount);
        if (!reference.empty()) {
            entry.reference = reference;
        }
        entry.description = "Wallet funded with " + amount.toString() + " " + domain::toString(currency);

        domain::BalanceKey key(ownerId, currency);

        commit(entry, {key}, [&](ports::output::BalanceHold& hold, domain::LedgerEntry& completed) {
            hold.balance(key).credit(amount);
            hold.record(completed);
        });

        return entry;
    }

    // ============================================
    // ПЕРЕВОД
    // ============================================

    domain::LedgerEntry transfer(
        const std::string& fromOwnerId,
        const std::string& toOwnerId,
        const domain::Decimal& amount,
        domain::Currency currency,
        const std::string& description) override
    {
        requireEligible(fromOwnerId);
        if (fromOwnerId == toOwnerId) {
            throw domain::LedgerException(
                domain::LedgerErrorCode::SameOwner, "Cannot transfer funds to the same user");
        }
        requireRecipient(toOwnerId);
        requirePositive(amount, "Transfer amount must be positive");

        auto entry = newEntry(fromOwnerId, domain::LedgerEntryKind::TRANSFER, currency, currency, amount);
        entry.counterpartyId = toOwnerId;
        entry.description = description.empty() ? "Transfer to user " + toOwnerId : description;

        domain::BalanceKey fromKey(fromOwnerId, currency);
        domain::BalanceKey toKey(toOwnerId, currency);

        commit(entry, {fromKey, toKey}, [&](ports::output::BalanceHold& hold, domain::LedgerEntry& completed) {
            if (!hold.balance(fromKey).debit(amount)) {
                throw domain::LedgerException(
                    domain::LedgerErrorCode::InsufficientFunds, "Insufficient available balance");
            }
            hold.balance(toKey).credit(amount);
            hold.record(completed);
        });

        return entry;
    }

    // ============================================
    // ОБМЕН ВАЛЮТЫ
    // ============================================

    domain::LedgerEntry trade(
        const std::string& ownerId,
        domain::Currency fromCurrency,
        domain::Currency toCurrency,
        const domain::Decimal& amount) override
    {
        requireEligible(ownerId);
        if (fromCurrency == toCurrency) {
            throw domain::LedgerException(
                domain::LedgerErrorCode::SameCurrency, "Cannot trade the same currency");
        }
        requirePositive(amount, "Trade amount must be positive");

        auto entry = newEntry(ownerId, domain::LedgerEntryKind::TRADE, fromCurrency, toCurrency, amount);
        // Курс ещё не получен: в FAILED записи без курса остаются нули
        entry.rate = domain::Decimal();
        entry.convertedAmount = domain::Decimal();

        domain::BalanceKey fromKey(ownerId, fromCurrency);
        domain::BalanceKey toKey(ownerId, toCurrency);

        commit(entry, {fromKey, toKey}, [&](ports::output::BalanceHold& hold, domain::LedgerEntry& completed) {
            double liveRate = rateService_->resolveRate(fromCurrency, toCurrency, false).rate;

            auto rate = domain::Decimal::fromDouble(liveRate);
            auto converted = amount * rate;
            entry.rate = rate;
            entry.convertedAmount = converted;

            checkDeviation(fromCurrency, toCurrency, liveRate);

            if (!hold.balance(fromKey).debit(amount)) {
                throw domain::LedgerException(
                    domain::LedgerErrorCode::InsufficientFunds,
                    "Insufficient " + domain::toString(fromCurrency) + " balance");
            }
            hold.balance(toKey).credit(converted);

            completed.rate = rate;
            completed.convertedAmount = converted;
            completed.description = "Trade " + amount.toString() + " " + domain::toString(fromCurrency) +
                                    " for " + converted.toString() + " " + domain::toString(toCurrency) +
                                    " at rate " + rate.toString();
            hold.record(completed);
        });

        return entry;
    }

    // ============================================
    // ЧТЕНИЕ
    // ============================================

    /**
     * @brief Балансы владельца; NGN-баланс создаётся, если его ещё нет
     */
    std::vector<domain::Balance> getBalances(const std::string& ownerId) override {
        requireEligible(ownerId);
        return withStorage([&]() {
            store_->getOrCreate(ownerId, domain::Currency::NGN);
            return store_->findBalances(ownerId);
        });
    }

    domain::TransactionPage getTransactions(
        const std::string& ownerId, size_t page, size_t limit) override
    {
        requireEligible(ownerId);

        domain::TransactionPage result;
        result.page = std::max<size_t>(page, 1);
        result.limit = limit == 0 ? DEFAULT_PAGE_LIMIT : std::min(limit, MAX_PAGE_LIMIT);

        withStorage([&]() {
            result.total = store_->countEntries(ownerId);
            result.totalPages = (result.total + result.limit - 1) / result.limit;
            // Страница за концом журнала пуста; смещение считается только внутри него
            if (result.page <= result.totalPages) {
                result.entries = store_->findEntries(
                    ownerId, result.limit, (result.page - 1) * result.limit);
            }
        });
        return result;
    }

    std::vector<domain::LedgerEntry> getTransactionsByKind(
        const std::string& ownerId, domain::LedgerEntryKind kind) override
    {
        requireEligible(ownerId);
        return withStorage([&]() { return store_->findEntriesByKind(ownerId, kind); });
    }

private:
    static constexpr size_t DEFAULT_PAGE_LIMIT = 10;
    static constexpr size_t MAX_PAGE_LIMIT = 100;

    using Mutation = std::function<void(ports::output::BalanceHold&, domain::LedgerEntry&)>;

    std::shared_ptr<ports::output::IBalanceStore> store_;
    std::shared_ptr<ports::input::IRateService> rateService_;
    std::shared_ptr<ports::input::IFallbackRateService> fallbackRates_;
    std::shared_ptr<ports::output::IEligibilityChecker> eligibility_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<settings::ILedgerSettings> settings_;

    void requireEligible(const std::string& ownerId) {
        if (ownerId.empty() || !eligibility_->isEligible(ownerId)) {
            std::cout << "[LedgerService] REJECTED: owner not eligible " << ownerId << std::endl;
            throw domain::LedgerException(
                domain::LedgerErrorCode::OwnerNotEligible, "User not verified or not found");
        }
    }

    void requireRecipient(const std::string& ownerId) {
        if (ownerId.empty() || !eligibility_->exists(ownerId)) {
            std::cout << "[LedgerService] REJECTED: recipient not found " << ownerId << std::endl;
            throw domain::LedgerException(
                domain::LedgerErrorCode::OwnerNotEligible, "Recipient not found");
        }
    }

    static void requirePositive(const domain::Decimal& amount, const std::string& message) {
        if (!amount.isPositive()) {
            throw domain::LedgerException(domain::LedgerErrorCode::InvalidAmount, message);
        }
    }

    static domain::LedgerEntry newEntry(
        const std::string& ownerId,
        domain::LedgerEntryKind kind,
        domain::Currency from,
        domain::Currency to,
        const domain::Decimal& amount)
    {
        domain::LedgerEntry entry;
        entry.id = utils::UuidGenerator::generate();
        entry.ownerId = ownerId;
        entry.kind = kind;
        entry.status = domain::LedgerEntryStatus::PENDING;
        entry.fromCurrency = from;
        entry.toCurrency = to;
        entry.amount = amount;
        entry.rate = domain::Decimal::fromUnits(1);
        entry.convertedAmount = amount;
        entry.createdAt = domain::Timestamp::now();
        return entry;
    }

    /**
     * @brief Провести операцию под захватом ключей
     *
     * mutation получает рабочий набор и копию entry в статусе COMPLETED.
     * При успехе entry заменяется этой копией; при отказе entry остаётся
     * неизменной, а в журнал уходит FAILED запись.
     */
    void commit(domain::LedgerEntry& entry,
                const std::vector<domain::BalanceKey>& keys,
                const Mutation& mutation)
    {
        domain::LedgerEntry completed;

        try {
            store_->withExclusiveHold(keys, [&](ports::output::BalanceHold& hold) {
                domain::LedgerEntry staged = entry;
                staged.status = domain::LedgerEntryStatus::COMPLETED;
                mutation(hold, staged);
                completed = staged;
            }, settings_->getHoldTimeout());

        } catch (const domain::LedgerException& e) {
            std::cerr << "[LedgerService] FAILED " << domain::toString(entry.kind)
                      << " " << entry.id << ": " << domain::toString(e.code())
                      << " (" << e.what() << ")" << std::endl;
            recordFailure(entry, e.what());
            throw;

        } catch (const domain::StorageException& e) {
            std::cerr << "[LedgerService] FAILED " << domain::toString(entry.kind)
                      << " " << entry.id << ": storage error (" << e.what() << ")" << std::endl;
            throw domain::LedgerException(
                e.isRetryable() ? domain::LedgerErrorCode::StorageUnavailable
                                : domain::LedgerErrorCode::Internal,
                std::string("Storage error: ") + e.what());

        } catch (const std::exception& e) {
            std::cerr << "[LedgerService] FAILED " << domain::toString(entry.kind)
                      << " " << entry.id << ": " << e.what() << std::endl;
            throw domain::LedgerException(
                domain::LedgerErrorCode::Internal,
                "Operation " + domain::toString(entry.kind) + " failed");
        }

        entry = completed;
        std::cout << "[LedgerService] COMPLETED " << domain::toString(entry.kind) << " " << entry.id
                  << ": " << entry.amount.toString() << " " << domain::toString(entry.fromCurrency)
                  << " owner=" << entry.ownerId << std::endl;
        notify(entry);
    }

    void recordFailure(const domain::LedgerEntry& entry, const std::string& reason) {
        domain::LedgerEntry failed = entry;
        failed.status = domain::LedgerEntryStatus::FAILED;
        failed.description = entry.description.empty() ? reason : entry.description + " (" + reason + ")";

        try {
            store_->appendEntry(failed);
        } catch (const std::exception& e) {
            std::cerr << "[LedgerService] Failed to record FAILED entry " << failed.id
                      << ": " << e.what() << std::endl;
            return;
        }
        notify(failed);
    }

    void notify(const domain::LedgerEntry& entry) {
        try {
            nlohmann::json event;
            event["entry_id"] = entry.id;
            event["owner_id"] = entry.ownerId;
            event["kind"] = domain::toString(entry.kind);
            event["amount"] = entry.amount.toDouble();
            event["currency"] = domain::toString(entry.fromCurrency);
            event["status"] = domain::toString(entry.status);
            event["timestamp"] = entry.createdAt.toString();

            eventPublisher_->publish(domain::routingKeyFor(entry.kind), event.dump());

        } catch (const std::exception& e) {
            std::cerr << "[LedgerService] Failed to publish " << domain::routingKeyFor(entry.kind)
                      << ": " << e.what() << std::endl;
        }
    }

    /**
     * @brief Проверка живого курса против резервной таблицы
     *
     * Выключена при LEDGER_MAX_RATE_DEVIATION_PERCENT = 0.
     */
    void checkDeviation(domain::Currency from, domain::Currency to, double liveRate) {
        double maxDeviation = settings_->getMaxRateDeviationPercent();
        if (maxDeviation <= 0.0) {
            return;
        }

        double reference = fallbackRates_->getRate(from, to);
        double deviation = std::fabs(liveRate - reference) / reference * 100.0;
        if (deviation > maxDeviation) {
            std::ostringstream message;
            message << "Live rate " << liveRate << " for " << domain::toString(from) << "/"
                    << domain::toString(to) << " deviates " << deviation
                    << "% from reference " << reference;
            throw domain::LedgerException(domain::LedgerErrorCode::RateUnavailable, message.str());
        }
    }

    template <typename Operation>
    auto withStorage(Operation&& operation) -> std::invoke_result_t<Operation&> {
        try {
            return operation();
        } catch (const domain::StorageException& e) {
            std::cerr << "[LedgerService] Storage error: " << e.what() << std::endl;
            throw domain::LedgerException(
                e.isRetryable() ? domain::LedgerErrorCode::StorageUnavailable
                                : domain::LedgerErrorCode::Internal,
                std::string("Storage error: ") + e.what());
        }
    }
};

} // namespace wallet::application
