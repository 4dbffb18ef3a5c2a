#pragma once

#include "application/EscrowService.hpp"
#include "application/SettlementService.hpp"
#include "application/MetricsService.hpp"
#include "adapters/secondary/persistence/InMemoryEscrowRepository.hpp"
#include "adapters/secondary/persistence/InMemorySettlementRepository.hpp"
#include "settings/MetricsSettings.hpp"
#include "mocks/MockEventPublisher.hpp"
#include "mocks/TestEscrowSettings.hpp"
#include <memory>

namespace escrow::tests {

/**
 * @brief Сервисы на in-memory хранилищах для тестов HTTP handlers
 */
struct InMemoryServices {
    InMemoryServices() {
        auto escrowSettings = std::make_shared<TestEscrowSettings>();
        auto escrowRepository = std::make_shared<adapters::secondary::InMemoryEscrowRepository>();
        auto coordinator = std::make_shared<application::EscrowCoordinator>(escrowSettings);

        publisher = std::make_shared<MockEventPublisher>();
        metrics = std::make_shared<application::MetricsService>(std::make_shared<settings::MetricsSettings>());
        escrowService = std::make_shared<application::EscrowService>(
            escrowRepository, coordinator, publisher, metrics, escrowSettings);
        settlementService = std::make_shared<application::SettlementService>(
            escrowRepository, std::make_shared<adapters::secondary::InMemorySettlementRepository>(),
            coordinator, publisher, metrics, escrowSettings);
    }

    // Escrow на одного продавца; возвращает платёж после создания
    domain::EscrowPayment createEscrow(const std::string& orderId, const std::string& amount,
                                       const std::string& storeId = "store-1") {
        domain::PaymentConfirmation c;
        c.orderId = orderId;
        c.buyerId = "buyer-1";
        c.currency = "USD";
        c.paymentTransactionId = "txn-" + orderId;
        c.totalAmount = domain::Money::parse(amount, "USD");

        domain::SellerShare share;
        share.storeId = storeId;
        share.amount = c.totalAmount;
        c.sellerShares.push_back(share);
        return escrowService->onOrderPaymentConfirmed(c);
    }

    std::shared_ptr<MockEventPublisher> publisher;
    std::shared_ptr<application::MetricsService> metrics;
    std::shared_ptr<ports::input::IEscrowService> escrowService;
    std::shared_ptr<ports::input::ISettlementService> settlementService;
};

} // namespace escrow::tests
