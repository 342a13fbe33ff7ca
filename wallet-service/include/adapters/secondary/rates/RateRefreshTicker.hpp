#pragma once

#include "application/RetryPolicy.hpp"
#include "ports/input/IFallbackRateService.hpp"
#include "settings/IFallbackRateSettings.hpp"
#include "domain/Timestamp.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace wallet::adapters::secondary::rates {

/**
 * @brief Фоновое обновление резервной таблицы курсов
 *
 * Каждые interval вызывает refreshIfStale(now). Неудачный цикл
 * повторяется через RetryPolicy; если и повторы не помогли, ошибка
 * пишется в лог, а таблица остаётся прежней до следующего тика.
 *
 * @example
 * ```cpp
 * RateRefreshTicker ticker(fallbackService, retryPolicy, settings);
 * ticker.start();                 // интервал из FALLBACK_REFRESH_INTERVAL_SECONDS
 * ...
 * ticker.stop();
 * ```
 *
 * Thread-safe: да
 */
class RateRefreshTicker {
public:
    RateRefreshTicker(
        std::shared_ptr<ports::input::IFallbackRateService> fallbackService,
        std::shared_ptr<application::RetryPolicy> retryPolicy,
        std::shared_ptr<settings::IFallbackRateSettings> settings)
        : fallbackService_(std::move(fallbackService))
        , retryPolicy_(std::move(retryPolicy))
        , settings_(std::move(settings))
        , running_(false)
        , tickCount_(0)
        , failedTicks_(0)
    {}

    ~RateRefreshTicker() {
        stop();
    }

    // Non-copyable, non-movable
    RateRefreshTicker(const RateRefreshTicker&) = delete;
    RateRefreshTicker& operator=(const RateRefreshTicker&) = delete;

    void start() {
        start(std::chrono::seconds(settings_->getRefreshIntervalSeconds()));
    }

    /**
     * @brief Запустить фоновый поток
     *
     * Первый тик выполняется сразу, затем раз в interval.
     */
    void start(std::chrono::milliseconds interval) {
        if (running_.exchange(true)) {
            return;  // Уже запущен
        }

        interval_ = interval;
        workerThread_ = std::thread([this]() {
            runLoop();
        });

        std::cout << "[RateRefreshTicker] Started, interval=" << interval_.count() << "ms" << std::endl;
    }

    void stop() {
        bool wasRunning = false;
        {
            // Флаг меняется под waitMutex_, иначе notify может попасть между
            // проверкой предиката и засыпанием потока и потеряться
            std::lock_guard<std::mutex> lock(waitMutex_);
            wasRunning = running_.exchange(false);
        }
        if (!wasRunning) {
            return;
        }

        wakeUp_.notify_all();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        std::cout << "[RateRefreshTicker] Stopped after " << tickCount_.load() << " ticks" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    /**
     * @brief Выполнить один цикл обновления (без фонового потока)
     * @return true если цикл завершился без ошибки
     */
    bool manualTick() {
        return tick();
    }

    uint64_t getTickCount() const {
        return tickCount_.load();
    }

    uint64_t getFailedTickCount() const {
        return failedTicks_.load();
    }

private:
    void runLoop() {
        while (running_) {
            tick();

            std::unique_lock<std::mutex> lock(waitMutex_);
            wakeUp_.wait_for(lock, interval_, [this]() { return !running_.load(); });
        }
    }

    bool tick() {
        ++tickCount_;
        try {
            bool refreshed = retryPolicy_->execute(
                [this]() { return fallbackService_->refreshIfStale(domain::Timestamp::now()); },
                "fallback rate refresh");
            if (refreshed) {
                std::cout << "[RateRefreshTicker] Fallback rates refreshed" << std::endl;
            }
            return true;
        } catch (const std::exception& e) {
            ++failedTicks_;
            std::cerr << "[RateRefreshTicker] Refresh cycle failed: " << e.what() << std::endl;
            return false;
        }
    }

    std::shared_ptr<ports::input::IFallbackRateService> fallbackService_;
    std::shared_ptr<application::RetryPolicy> retryPolicy_;
    std::shared_ptr<settings::IFallbackRateSettings> settings_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> tickCount_;
    std::atomic<uint64_t> failedTicks_;
    std::chrono::milliseconds interval_{0};

    std::mutex waitMutex_;
    std::condition_variable wakeUp_;
    std::thread workerThread_;
};

} // namespace wallet::adapters::secondary::rates
