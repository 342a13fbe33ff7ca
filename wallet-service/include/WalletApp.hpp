// include/WalletApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/AuthClientSettings.hpp"
#include "settings/CacheSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/FallbackRateSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/RateProviderSettings.hpp"
#include "settings/RateSourceSettings.hpp"
#include "settings/RetrySettings.hpp"

// Ports
#include "ports/input/IFallbackRateService.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/input/IRateService.hpp"
#include "ports/output/IBalanceStore.hpp"
#include "ports/output/IEligibilityChecker.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IFallbackRateTable.hpp"
#include "ports/output/IRateProvider.hpp"
#include "ports/output/IRateSourceChain.hpp"

// Application
#include "application/FallbackRateService.hpp"
#include "application/LedgerService.hpp"
#include "application/RateService.hpp"
#include "application/RetryPolicy.hpp"

// Secondary Adapters
#include "adapters/secondary/CachedRateProvider.hpp"
#include "adapters/secondary/HttpEligibilityChecker.hpp"
#include "adapters/secondary/HttpExchangeRateProvider.hpp"
#include "adapters/secondary/InMemoryBalanceStore.hpp"
#include "adapters/secondary/InMemoryFallbackRateTable.hpp"
#include "adapters/secondary/PostgresBalanceStore.hpp"
#include "adapters/secondary/events/RabbitMQEventPublisher.hpp"
#include "adapters/secondary/rates/RateRefreshTicker.hpp"
#include "adapters/secondary/rates/RateSourceFactory.hpp"

// Primary Adapters
#include "adapters/primary/ConvertCurrencyHandler.hpp"
#include "adapters/primary/FundWalletHandler.hpp"
#include "adapters/primary/GetBalancesHandler.hpp"
#include "adapters/primary/GetRatesHandler.hpp"
#include "adapters/primary/GetTransactionsHandler.hpp"
#include "adapters/primary/TradeCurrencyHandler.hpp"
#include "adapters/primary/TransferFundsHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace wallet
{

    /**
     * @brief Wallet Service Application
     *
     * HTTP: пополнение, переводы, обмен валют, балансы, история, курсы.
     * Публикует: ledger.funding, ledger.transfer, ledger.trade (в wallet.events)
     * Фон: обновление резервной таблицы курсов (RateRefreshTicker)
     */
    class WalletApp : public BoostBeastApplication
    {
    public:
        WalletApp() { std::cout << "[WalletApp] Initializing..." << std::endl; }
        ~WalletApp() override
        {
            if (rateRefreshTicker_)
            {
                rateRefreshTicker_->stop();
            }
            if (eventPublisher_)
            {
                eventPublisher_->stop();
            }
            std::cout << "[WalletApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[WalletApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[WalletApp] Configuring DI..." << std::endl;

            // Шаг 1: RabbitMQ publisher и хранилище балансов создаются заранее
            // и попадают в основной injector как instance binding
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            eventPublisher_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQEventPublisher>>();

            auto balanceStore = createBalanceStore();

            // Шаг 2: Основной injector
            auto injector = di::make_injector(
                di::bind<settings::AuthClientSettings>().in(di::singleton),
                di::bind<settings::CacheSettings>().in(di::singleton),
                di::bind<settings::IRateProviderSettings>().to<settings::RateProviderSettings>().in(di::singleton),
                di::bind<settings::IRateSourceSettings>().to<settings::RateSourceSettings>().in(di::singleton),
                di::bind<settings::IRetrySettings>().to<settings::RetrySettings>().in(di::singleton),
                di::bind<settings::IFallbackRateSettings>().to<settings::FallbackRateSettings>().in(di::singleton),
                di::bind<settings::ILedgerSettings>().to<settings::LedgerSettings>().in(di::singleton),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<adapters::secondary::HttpExchangeRateProvider>().in(di::singleton),
                di::bind<ports::output::IRateProvider>().to<adapters::secondary::CachedRateProvider>().in(di::singleton),
                di::bind<ports::output::IRateSourceChain>().to<adapters::secondary::rates::RateSourceFactory>().in(di::singleton),
                di::bind<ports::output::IFallbackRateTable>().to<adapters::secondary::InMemoryFallbackRateTable>().in(di::singleton),
                di::bind<ports::output::IEligibilityChecker>().to<adapters::secondary::HttpEligibilityChecker>().in(di::singleton),

                di::bind<ports::output::IEventPublisher>().to(eventPublisher_),
                di::bind<ports::output::IBalanceStore>().to(balanceStore),

                di::bind<application::RetryPolicy>().in(di::singleton),
                di::bind<ports::input::IFallbackRateService>().to<application::FallbackRateService>().in(di::singleton),
                di::bind<ports::input::IRateService>().to<application::RateService>().in(di::singleton),
                di::bind<ports::input::ILedgerService>().to<application::LedgerService>().in(di::singleton));

            // Шаг 3: HTTP Handlers

            handlers_[getHandlerKey("POST", "/api/v1/wallet/fund")] =
                injector.create<std::shared_ptr<adapters::primary::FundWalletHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/wallet/transfer")] =
                injector.create<std::shared_ptr<adapters::primary::TransferFundsHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/wallet/trade")] =
                injector.create<std::shared_ptr<adapters::primary::TradeCurrencyHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/wallet/balances")] =
                injector.create<std::shared_ptr<adapters::primary::GetBalancesHandler>>();

            auto transactionsHandler = injector.create<std::shared_ptr<adapters::primary::GetTransactionsHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/wallet/transactions")] = transactionsHandler;
            handlers_[getHandlerKey("GET", "/api/v1/wallet/transactions/type/*")] = transactionsHandler;

            handlers_[getHandlerKey("GET", "/api/v1/fx/rates")] =
                injector.create<std::shared_ptr<adapters::primary::GetRatesHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/fx/convert")] =
                injector.create<std::shared_ptr<adapters::primary::ConvertCurrencyHandler>>();

            // Шаг 4: Фоновое обновление резервных курсов
            rateRefreshTicker_ = injector.create<std::shared_ptr<adapters::secondary::rates::RateRefreshTicker>>();
            rateRefreshTicker_->start();

            // Шаг 5: RabbitMQ
            std::cout << "[WalletApp] Starting RabbitMQ..." << std::endl;
            eventPublisher_->start();

            std::cout << "[WalletApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<adapters::secondary::RabbitMQEventPublisher> eventPublisher_;
        std::shared_ptr<adapters::secondary::rates::RateRefreshTicker> rateRefreshTicker_;

        /**
         * @brief Хранилище балансов по LEDGER_STORE (postgres | memory)
         */
        static std::shared_ptr<ports::output::IBalanceStore> createBalanceStore()
        {
            settings::LedgerSettings ledgerSettings;
            if (ledgerSettings.getStoreType() == "memory")
            {
                std::cout << "[WalletApp] Balance store: in-memory" << std::endl;
                return std::make_shared<adapters::secondary::InMemoryBalanceStore>();
            }

            std::cout << "[WalletApp] Balance store: postgres" << std::endl;
            return std::make_shared<adapters::secondary::PostgresBalanceStore>(
                std::make_shared<settings::DbSettings>());
        }
    };

} // namespace wallet
