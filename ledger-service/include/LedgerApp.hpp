// include/LedgerApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <KeyedLockManager.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

// Ports
#include "ports/input/IBalanceProjector.hpp"
#include "ports/input/ICashService.hpp"
#include "ports/input/IStockService.hpp"
#include "ports/output/IBankAccountRepository.hpp"
#include "ports/output/IBankEntryRepository.hpp"
#include "ports/output/IDocumentRepository.hpp"
#include "ports/output/IIdempotencyRepository.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IProjectionRepository.hpp"
#include "ports/output/IStockBatchRepository.hpp"

// Application
#include "application/BalanceProjector.hpp"
#include "application/CashReconciliationService.hpp"
#include "application/IdempotencyGuard.hpp"
#include "application/StockReconciliationService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/PostgresBankAccountRepository.hpp"
#include "adapters/secondary/persistence/PostgresBankEntryRepository.hpp"
#include "adapters/secondary/persistence/PostgresDocumentRepository.hpp"
#include "adapters/secondary/persistence/PostgresIdempotencyRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedgerStore.hpp"
#include "adapters/secondary/persistence/PostgresProjectionRepository.hpp"
#include "adapters/secondary/persistence/PostgresStockBatchRepository.hpp"

// Primary Adapters
#include "adapters/primary/CashHandler.hpp"
#include "adapters/primary/DocumentHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/LedgerHandler.hpp"
#include "adapters/primary/StockHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace pharmacy
{

    /**
     * @brief Ledger Service Application
     *
     * Журнал движений склада и денег в PostgreSQL, проекции остатков,
     * сверка чеков, накладных и банковской выписки.
     */
    class LedgerApp : public BoostBeastApplication
    {
    public:
        LedgerApp() { std::cout << "[LedgerApp] Initializing..." << std::endl; }
        ~LedgerApp() override { std::cout << "[LedgerApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[LedgerApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[LedgerApp] Configuring DI..." << std::endl;

            auto injector = di::make_injector(
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<settings::LedgerSettings>().in(di::singleton),
                di::bind<KeyedLockManager>().in(di::singleton),

                di::bind<ports::output::ILedgerStore>().to<adapters::secondary::PostgresLedgerStore>().in(di::singleton),
                di::bind<ports::output::IProjectionRepository>().to<adapters::secondary::PostgresProjectionRepository>().in(di::singleton),
                di::bind<ports::output::IIdempotencyRepository>().to<adapters::secondary::PostgresIdempotencyRepository>().in(di::singleton),
                di::bind<ports::output::IStockBatchRepository>().to<adapters::secondary::PostgresStockBatchRepository>().in(di::singleton),
                di::bind<ports::output::IDocumentRepository>().to<adapters::secondary::PostgresDocumentRepository>().in(di::singleton),
                di::bind<ports::output::IBankAccountRepository>().to<adapters::secondary::PostgresBankAccountRepository>().in(di::singleton),
                di::bind<ports::output::IBankEntryRepository>().to<adapters::secondary::PostgresBankEntryRepository>().in(di::singleton),

                di::bind<application::IdempotencyGuard>().in(di::singleton),
                di::bind<ports::input::IBalanceProjector>().to<application::BalanceProjector>().in(di::singleton),
                di::bind<ports::input::IStockService>().to<application::StockReconciliationService>().in(di::singleton),
                di::bind<ports::input::ICashService>().to<application::CashReconciliationService>().in(di::singleton));

            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            auto stockHandler = injector.create<std::shared_ptr<adapters::primary::StockHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/stock/receipts")] = stockHandler;
            handlers_[getHandlerKey("POST", "/api/v1/stock/sales")] = stockHandler;
            handlers_[getHandlerKey("POST", "/api/v1/stock/adjustments")] = stockHandler;
            handlers_[getHandlerKey("GET", "/api/v1/stock")] = stockHandler;
            handlers_[getHandlerKey("GET", "/api/v1/stock/*")] = stockHandler;

            auto documentHandler = injector.create<std::shared_ptr<adapters::primary::DocumentHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/sales")] = documentHandler;
            handlers_[getHandlerKey("GET", "/api/v1/sales/*")] = documentHandler;
            handlers_[getHandlerKey("POST", "/api/v1/invoices")] = documentHandler;
            handlers_[getHandlerKey("GET", "/api/v1/invoices/*")] = documentHandler;
            handlers_[getHandlerKey("POST", "/api/v1/invoices/*")] = documentHandler;

            auto cashHandler = injector.create<std::shared_ptr<adapters::primary::CashHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/bank/accounts")] = cashHandler;
            handlers_[getHandlerKey("POST", "/api/v1/bank/entries")] = cashHandler;
            handlers_[getHandlerKey("POST", "/api/v1/bank/entries/*")] = cashHandler;
            handlers_[getHandlerKey("GET", "/api/v1/bank/*")] = cashHandler;

            auto ledgerHandler = injector.create<std::shared_ptr<adapters::primary::LedgerHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/ledger")] = ledgerHandler;
            handlers_[getHandlerKey("GET", "/api/v1/ledger/verify")] = ledgerHandler;
            handlers_[getHandlerKey("POST", "/api/v1/ledger/rebuild")] = ledgerHandler;

            std::cout << "[LedgerApp] Ready" << std::endl;
        }
    };

} // namespace pharmacy
