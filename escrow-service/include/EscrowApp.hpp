// include/EscrowApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/ServerSettings.hpp"
#include "settings/EscrowSettings.hpp"
#include "settings/MetricsSettings.hpp"

// Ports
#include "ports/input/IEscrowService.hpp"
#include "ports/input/ISettlementService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IEscrowRepository.hpp"
#include "ports/output/ISettlementRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"

// Application
#include "application/EscrowCoordinator.hpp"
#include "application/EscrowService.hpp"
#include "application/SettlementService.hpp"
#include "application/MetricsService.hpp"
#include "application/EscrowEventHandler.hpp"

// Secondary Adapters
#include "adapters/secondary/events/RabbitMQAdapter.hpp"
#include "adapters/secondary/persistence/PostgresEscrowRepository.hpp"
#include "adapters/secondary/persistence/PostgresSettlementRepository.hpp"
#include "adapters/secondary/persistence/InMemoryEscrowRepository.hpp"
#include "adapters/secondary/persistence/InMemorySettlementRepository.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"
#include "adapters/primary/EscrowQueryHandler.hpp"
#include "adapters/primary/AllocationCommandHandler.hpp"
#include "adapters/primary/SellerBalanceHandler.hpp"
#include "adapters/primary/SettlementHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace escrow
{

    /**
     * @brief Escrow & Settlement Service Application
     *
     * Слушает: order.payment_confirmed, shipment.delivered, payout.requested,
     *          refund.requested, settlement.period_ended (escrow.events)
     * Публикует: escrow.*, settlement.closed, settlement.adjusted
     * HTTP: чтение escrow/журнала/ведомостей и ручные операции
     */
    class EscrowApp : public BoostBeastApplication
    {
    public:
        EscrowApp() { std::cout << "[EscrowApp] Initializing..." << std::endl; }

        ~EscrowApp() override
        {
            std::cout << "[EscrowApp] Shutting down..." << std::endl;
            if (escrowEventHandler_)
            {
                escrowEventHandler_->cancelPendingWork();
            }
            if (rabbitMQAdapter_)
            {
                rabbitMQAdapter_->stop();
            }
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);

            settings::ServerSettings server;
            std::cout << "[EscrowApp] Environment loaded, listening on "
                      << server.getHost() << ":" << server.getPort() << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[EscrowApp] Configuring DI..." << std::endl;

            // Шаг 1: RabbitMQAdapter - один экземпляр для Publisher и Consumer
            auto rabbitInjector = di::make_injector(
                di::bind<settings::RabbitMQSettings>().in(di::singleton));
            rabbitMQAdapter_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

            // Шаг 2: хранилище выбирается по ESCROW_STORAGE
            auto escrowSettings = std::make_shared<settings::EscrowSettings>();
            std::shared_ptr<ports::output::IEscrowRepository> escrowRepository;
            std::shared_ptr<ports::output::ISettlementRepository> settlementRepository;

            if (escrowSettings->getStorage() == "memory")
            {
                std::cout << "[EscrowApp] Storage: in-memory" << std::endl;
                escrowRepository = std::make_shared<adapters::secondary::InMemoryEscrowRepository>();
                settlementRepository = std::make_shared<adapters::secondary::InMemorySettlementRepository>();
            }
            else
            {
                std::cout << "[EscrowApp] Storage: PostgreSQL" << std::endl;
                auto dbInjector = di::make_injector(
                    di::bind<settings::DbSettings>().in(di::singleton));
                escrowRepository = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresEscrowRepository>>();
                settlementRepository = dbInjector.create<std::shared_ptr<adapters::secondary::PostgresSettlementRepository>>();
            }

            // Шаг 3: основной injector с instance binding
            auto injector = di::make_injector(
                di::bind<settings::IEscrowSettings>().to(escrowSettings),
                di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),

                di::bind<ports::output::IEscrowRepository>().to(escrowRepository),
                di::bind<ports::output::ISettlementRepository>().to(settlementRepository),

                di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter_),
                di::bind<ports::output::IEventConsumer>().to(rabbitMQAdapter_),

                di::bind<application::EscrowCoordinator>().in(di::singleton),
                di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),
                di::bind<ports::input::IEscrowService>().to<application::EscrowService>().in(di::singleton),
                di::bind<ports::input::ISettlementService>().to<application::SettlementService>().in(di::singleton));

            // Шаг 4: HTTP Handlers (каждый обёрнут счётчиком запросов)
            auto metrics = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
            auto withMetrics = [&metrics](std::shared_ptr<IHttpHandler> handler) -> std::shared_ptr<IHttpHandler>
            {
                return std::make_shared<adapters::primary::MetricsDecoratorHandler>(std::move(handler), metrics);
            };

            handlers_[getHandlerKey("GET", "/health")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
            handlers_[getHandlerKey("GET", "/metrics")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>());

            auto escrowHandler = withMetrics(injector.create<std::shared_ptr<adapters::primary::EscrowQueryHandler>>());
            handlers_[getHandlerKey("GET", "/api/v1/escrows")] = escrowHandler;
            handlers_[getHandlerKey("GET", "/api/v1/escrows/*")] = escrowHandler;
            handlers_[getHandlerKey("GET", "/api/v1/escrows/*/ledger")] = escrowHandler;
            handlers_[getHandlerKey("GET", "/api/v1/escrows/*/balance")] = escrowHandler;
            handlers_[getHandlerKey("GET", "/api/v1/escrows/*/reconcile")] = escrowHandler;
            handlers_[getHandlerKey("POST", "/api/v1/escrows/*/refund")] = escrowHandler;

            auto allocationHandler = withMetrics(injector.create<std::shared_ptr<adapters::primary::AllocationCommandHandler>>());
            handlers_[getHandlerKey("POST", "/api/v1/allocations/*/eligible")] = allocationHandler;
            handlers_[getHandlerKey("POST", "/api/v1/allocations/*/release")] = allocationHandler;
            handlers_[getHandlerKey("POST", "/api/v1/allocations/*/refund")] = allocationHandler;

            handlers_[getHandlerKey("GET", "/api/v1/stores/*/escrow-balance")] =
                withMetrics(injector.create<std::shared_ptr<adapters::primary::SellerBalanceHandler>>());

            auto settlementHandler = withMetrics(injector.create<std::shared_ptr<adapters::primary::SettlementHandler>>());
            handlers_[getHandlerKey("POST", "/api/v1/settlements/close")] = settlementHandler;
            handlers_[getHandlerKey("GET", "/api/v1/settlements")] = settlementHandler;
            handlers_[getHandlerKey("GET", "/api/v1/settlements/*")] = settlementHandler;
            handlers_[getHandlerKey("POST", "/api/v1/settlements/*/adjustments")] = settlementHandler;
            handlers_[getHandlerKey("POST", "/api/v1/settlements/*/approve")] = settlementHandler;
            handlers_[getHandlerKey("POST", "/api/v1/settlements/*/export")] = settlementHandler;
            handlers_[getHandlerKey("POST", "/api/v1/settlements/*/notes")] = settlementHandler;

            // Шаг 5: Event Handler через DI, подписывается в конструкторе
            escrowEventHandler_ = injector.create<std::shared_ptr<application::EscrowEventHandler>>();

            // Шаг 6: RabbitMQ запускается ПОСЛЕ регистрации всех подписок
            std::cout << "[EscrowApp] Starting RabbitMQ..." << std::endl;
            rabbitMQAdapter_->start();

            std::cout << "[EscrowApp] Ready" << std::endl;
        }

    private:
        std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
        std::shared_ptr<application::EscrowEventHandler> escrowEventHandler_;
    };

} // namespace escrow
