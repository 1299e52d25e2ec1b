// include/InvoicingApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/AuthClientSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LockSettings.hpp"
#include "settings/StorageSettings.hpp"

// Ports
#include "ports/input/IInvoiceService.hpp"
#include "ports/input/IInventoryService.hpp"
#include "ports/output/IInvoiceStore.hpp"
#include "ports/output/IProductRepository.hpp"
#include "ports/output/IDirectory.hpp"
#include "ports/output/IAuthClient.hpp"

// Application
#include "application/InvoiceService.hpp"
#include "application/InventoryService.hpp"

// Secondary Adapters
#include "adapters/secondary/HttpAuthClient.hpp"
#include "adapters/secondary/InMemoryInvoiceStore.hpp"
#include "adapters/secondary/InMemoryProductRepository.hpp"
#include "adapters/secondary/InMemoryCustomerRepository.hpp"
#include "adapters/secondary/InMemoryUserRepository.hpp"
#include "adapters/secondary/JsonSeedLoader.hpp"
#include "adapters/secondary/PostgresInvoiceStore.hpp"
#include "adapters/secondary/PostgresProductRepository.hpp"
#include "adapters/secondary/PostgresCustomerRepository.hpp"
#include "adapters/secondary/PostgresUserRepository.hpp"

// Primary Adapters
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/ActorExtractorMiddleware.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CreateInvoiceHandler.hpp"
#include "adapters/primary/GetInvoicesHandler.hpp"
#include "adapters/primary/GetInvoiceHandler.hpp"
#include "adapters/primary/InvoiceCommandHandler.hpp"
#include "adapters/primary/GetInventoryTransactionsHandler.hpp"
#include "adapters/primary/CreateStockAdjustmentHandler.hpp"
#include "adapters/primary/GetProductStockHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace invoicing
{

    /**
     * @brief Invoice Service Application
     *
     * HTTP: счета (создание, список, переходы жизненного цикла) и журнал склада.
     * Хранилище: PostgreSQL или in-memory (INVOICING_STORAGE=memory).
     */
    class InvoicingApp : public BoostBeastApplication
    {
    public:
        InvoicingApp() { std::cout << "[InvoicingApp] Initializing..." << std::endl; }
        ~InvoicingApp() override { std::cout << "[InvoicingApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[InvoicingApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[InvoicingApp] Configuring DI..." << std::endl;

            auto storageSettings = std::make_shared<settings::StorageSettings>();
            auto lockSettings = std::make_shared<settings::LockSettings>();

            // Шаг 1: Хранилище, выбранное через INVOICING_STORAGE
            std::shared_ptr<ports::output::IInvoiceStore> store;
            std::shared_ptr<ports::output::IProductRepository> products;
            std::shared_ptr<ports::output::ICustomerRepository> customers;
            std::shared_ptr<ports::output::IUserRepository> users;

            if (storageSettings->useInMemory())
            {
                auto memoryStore = std::make_shared<adapters::secondary::InMemoryInvoiceStore>(lockSettings);
                auto memoryCustomers = std::make_shared<adapters::secondary::InMemoryCustomerRepository>();
                auto memoryUsers = std::make_shared<adapters::secondary::InMemoryUserRepository>();

                if (!storageSettings->getSeedFile().empty())
                {
                    adapters::secondary::JsonSeedLoader::loadFile(
                        storageSettings->getSeedFile(), *memoryStore, *memoryCustomers, *memoryUsers);
                }

                store = memoryStore;
                products = std::make_shared<adapters::secondary::InMemoryProductRepository>(memoryStore);
                customers = memoryCustomers;
                users = memoryUsers;
            }
            else
            {
                auto dbInjector = di::make_injector(
                    di::bind<settings::DbSettings>().in(di::singleton),
                    di::bind<settings::LockSettings>().to(lockSettings));

                store = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresInvoiceStore>>();
                products = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresProductRepository>>();
                customers = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresCustomerRepository>>();
                users = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresUserRepository>>();
            }
            std::cout << "[InvoicingApp] Storage: " << storageSettings->getBackend() << std::endl;

            // Шаг 2: Основной injector с instance binding для хранилища
            auto injector = di::make_injector(
                di::bind<settings::StorageSettings>().to(storageSettings),
                di::bind<settings::LockSettings>().to(lockSettings),
                di::bind<settings::AuthClientSettings>().in(di::singleton),

                di::bind<ports::output::IInvoiceStore>().to(store),
                di::bind<ports::output::IProductRepository>().to(products),
                di::bind<ports::output::ICustomerRepository>().to(customers),
                di::bind<ports::output::IUserRepository>().to(users),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<ports::output::IAuthClient>().to<adapters::secondary::HttpAuthClient>().in(di::singleton),

                di::bind<ports::input::IInvoiceService>().to<application::InvoiceService>().in(di::singleton),
                di::bind<ports::input::IInventoryService>().to<application::InventoryService>().in(di::singleton));

            // Шаг 3: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            auto actorMiddleware = injector.create<std::shared_ptr<adapters::primary::ActorExtractorMiddleware>>();
            auto secured = [&actorMiddleware](std::shared_ptr<IHttpHandler> handler)
            {
                return std::make_shared<adapters::primary::ChainHandler>(actorMiddleware, handler);
            };

            handlers_[getHandlerKey("POST", "/api/v1/invoices")] =
                secured(injector.create<std::shared_ptr<adapters::primary::CreateInvoiceHandler>>());
            handlers_[getHandlerKey("GET", "/api/v1/invoices")] =
                secured(injector.create<std::shared_ptr<adapters::primary::GetInvoicesHandler>>());
            handlers_[getHandlerKey("GET", "/api/v1/invoices/*")] =
                secured(injector.create<std::shared_ptr<adapters::primary::GetInvoiceHandler>>());

            auto commandHandler = secured(injector.create<std::shared_ptr<adapters::primary::InvoiceCommandHandler>>());
            for (const char *action : {"reserve", "approve", "ship", "deliver", "cancel"})
            {
                handlers_[getHandlerKey("POST", std::string("/api/v1/invoices/*/") + action)] = commandHandler;
            }

            handlers_[getHandlerKey("GET", "/api/v1/inventory/transactions")] =
                secured(injector.create<std::shared_ptr<adapters::primary::GetInventoryTransactionsHandler>>());
            handlers_[getHandlerKey("POST", "/api/v1/inventory/adjustments")] =
                secured(injector.create<std::shared_ptr<adapters::primary::CreateStockAdjustmentHandler>>());
            handlers_[getHandlerKey("GET", "/api/v1/inventory/products/*")] =
                secured(injector.create<std::shared_ptr<adapters::primary::GetProductStockHandler>>());

            std::cout << "[InvoicingApp] Ready" << std::endl;
        }
    };

} // namespace invoicing
