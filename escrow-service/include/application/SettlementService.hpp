#pragma once

#include "ports/input/ISettlementService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/output/IEscrowRepository.hpp"
#include "ports/output/ISettlementRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/EscrowCoordinator.hpp"
#include "settings/IEscrowSettings.hpp"
#include "domain/Settlement.hpp"
#include "domain/SellerBalance.hpp"
#include "utils/JsonMapper.hpp"
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <map>
#include <memory>
#include <iostream>

namespace escrow::application {

/**
 * @brief Сервис расчётных ведомостей
 *
 * Закрытие периода читает журнал магазина (без блокировки платежей),
 * строит по строке на аллокацию с движениями в периоде и сохраняет ведомость
 * целиком одной транзакцией. Закрытие одного периода одного магазина
 * сериализуется через EscrowCoordinator, разные магазины закрываются параллельно.
 */
class SettlementService : public ports::input::ISettlementService {
public:
    SettlementService(
        std::shared_ptr<ports::output::IEscrowRepository> escrowRepository,
        std::shared_ptr<ports::output::ISettlementRepository> settlementRepository,
        std::shared_ptr<EscrowCoordinator> coordinator,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<ports::input::IMetricsService> metrics,
        std::shared_ptr<settings::IEscrowSettings> settings
    ) : escrowRepository_(std::move(escrowRepository))
      , settlementRepository_(std::move(settlementRepository))
      , coordinator_(std::move(coordinator))
      , eventPublisher_(std::move(eventPublisher))
      , metrics_(std::move(metrics))
      , workers_(settings->getSettlementWorkers())
    {
        std::cout << "[SettlementService] Created, workers: " << workers_ << std::endl;
    }

    domain::Settlement closeSettlementPeriod(const std::string& storeId, int year, int month) override {
        if (storeId.empty()) {
            throw domain::InvalidArgumentException("Store ID is required.");
        }
        auto period = domain::SettlementPeriod::of(year, month);

        // Без токена отмены результат всегда есть
        return *close(storeId, period, nullptr);
    }

    std::vector<ports::input::SettlementCloseResult> closeAllSettlements(
        int year, int month, const utils::CancellationToken& cancellation) override
    {
        auto period = domain::SettlementPeriod::of(year, month);
        auto stores = escrowRepository_->findStoresWithActivity(period.start(), period.end());

        std::cout << "[SettlementService] Closing period " << period.code() << " for "
                  << stores.size() << " store(s)" << std::endl;

        std::vector<ports::input::SettlementCloseResult> results(stores.size());
        boost::asio::thread_pool pool(workers_);

        for (size_t i = 0; i < stores.size(); ++i) {
            boost::asio::post(pool, [this, &stores, &results, &period, &cancellation, i]() {
                auto& result = results[i];
                result.storeId = stores[i];
                try {
                    result.settlement = close(stores[i], period, &cancellation);
                    result.cancelled = !result.settlement.has_value();
                } catch (const std::exception& e) {
                    result.error = e.what();
                    std::cerr << "[SettlementService] Failed to close " << stores[i]
                              << " for " << period.code() << ": " << e.what() << std::endl;
                }
            });
        }
        pool.join();

        size_t closed = 0;
        size_t cancelled = 0;
        for (const auto& result : results) {
            if (result.succeeded()) ++closed;
            if (result.cancelled) ++cancelled;
        }
        std::cout << "[SettlementService] Period " << period.code() << ": " << closed
                  << " closed, " << cancelled << " cancelled, "
                  << (results.size() - closed - cancelled) << " failed" << std::endl;

        return results;
    }

    domain::Settlement recordAdjustment(
        const std::string& settlementId,
        int originalYear,
        int originalMonth,
        const domain::Money& amount,
        const std::string& reason,
        const std::optional<std::string>& relatedOrderId,
        const std::optional<std::string>& relatedOrderNumber) override
    {
        return coordinator_->execute("settlement:" + settlementId, [&] {
            auto settlement = loadSettlement(settlementId);

            auto adjustment = domain::SettlementAdjustment::create(
                settlement.id(), originalYear, originalMonth, amount, reason,
                relatedOrderId, relatedOrderNumber);
            settlement.recordAdjustment(adjustment);
            settlementRepository_->addAdjustment(adjustment);

            std::cout << "[SettlementService] Adjustment " << amount.toString() << " "
                      << amount.currency() << " on " << settlement.settlementNumber()
                      << " for period " << adjustment.originalPeriod().code() << std::endl;

            metrics_->increment("settlement_adjustments_total");

            auto event = utils::JsonMapper::toJson(adjustment);
            event["settlement_id"] = settlement.id();
            event["store_id"] = settlement.storeId();
            publish("settlement.adjusted", event);
            return settlement;
        });
    }

    domain::Settlement approveSettlement(const std::string& settlementId, const std::string& approvedBy) override {
        return mutate(settlementId, [&](domain::Settlement& settlement) {
            settlement.approve(approvedBy);
        });
    }

    domain::Settlement markExported(const std::string& settlementId) override {
        return mutate(settlementId, [](domain::Settlement& settlement) {
            settlement.markExported();
        });
    }

    domain::Settlement updateNotes(const std::string& settlementId, const std::string& notes) override {
        return mutate(settlementId, [&](domain::Settlement& settlement) {
            settlement.updateNotes(notes);
        });
    }

    std::optional<domain::Settlement> getSettlement(const std::string& settlementId) override {
        return settlementRepository_->findById(settlementId);
    }

    std::optional<domain::Settlement> findSettlement(const std::string& storeId, int year, int month) override {
        auto period = domain::SettlementPeriod::of(year, month);
        return settlementRepository_->findByStoreAndPeriod(storeId, period.year, period.month);
    }

    std::vector<domain::Settlement> listSettlements(const std::string& storeId) override {
        return settlementRepository_->listByStore(storeId);
    }

private:
    std::shared_ptr<ports::output::IEscrowRepository> escrowRepository_;
    std::shared_ptr<ports::output::ISettlementRepository> settlementRepository_;
    std::shared_ptr<EscrowCoordinator> coordinator_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    size_t workers_;

    /**
     * @return std::nullopt, если закрытие отменено (в хранилище ничего не записано)
     */
    std::optional<domain::Settlement> close(
        const std::string& storeId,
        const domain::SettlementPeriod& period,
        const utils::CancellationToken* cancellation)
    {
        std::string key = "settlement:" + storeId + ":" + period.code();

        return coordinator_->execute(key, [&]() -> std::optional<domain::Settlement> {
            if (auto existing = settlementRepository_->findByStoreAndPeriod(storeId, period.year, period.month)) {
                std::cout << "[SettlementService] " << existing->settlementNumber()
                          << " already closed, returning existing" << std::endl;
                return existing;
            }

            auto settlement = build(storeId, period, cancellation);
            if (!settlement || isCancelled(cancellation)) {
                std::cout << "[SettlementService] Close of " << storeId << " for "
                          << period.code() << " cancelled, nothing saved" << std::endl;
                return std::nullopt;
            }

            try {
                settlementRepository_->insert(*settlement);
            } catch (const domain::ContentionException&) {
                // Параллельный процесс закрыл тот же период раньше
                if (auto existing = settlementRepository_->findByStoreAndPeriod(storeId, period.year, period.month)) {
                    return existing;
                }
                throw;
            }

            std::cout << "[SettlementService] " << settlement->settlementNumber() << " closed: "
                      << settlement->items().size() << " item(s), net payable "
                      << settlement->netPayable().toString() << " " << settlement->currency() << std::endl;

            metrics_->increment("settlements_closed_total");
            publish("settlement.closed", utils::JsonMapper::toJson(*settlement));
            return settlement;
        });
    }

    std::optional<domain::Settlement> build(
        const std::string& storeId,
        const domain::SettlementPeriod& period,
        const utils::CancellationToken* cancellation)
    {
        auto entries = escrowRepository_->getLedgerByStore(storeId);

        std::map<std::string, std::vector<domain::LedgerEntry>> byAllocation;
        std::vector<std::string> activeAllocations;
        std::string currency;

        for (const auto& entry : entries) {
            if (!entry.allocationId()) {
                continue;
            }
            if (!domain::isReleaseAction(entry.action()) && !domain::isRefundAction(entry.action())) {
                continue;
            }

            auto& bucket = byAllocation[*entry.allocationId()];
            bucket.push_back(entry);

            if (period.contains(entry.createdAt())) {
                if (currency.empty()) {
                    currency = entry.currency();
                } else if (currency != entry.currency()) {
                    throw domain::CurrencyMismatchException(currency, entry.currency());
                }
                if (std::find(activeAllocations.begin(), activeAllocations.end(), *entry.allocationId())
                        == activeAllocations.end()) {
                    activeAllocations.push_back(*entry.allocationId());
                }
            }
        }

        if (currency.empty()) {
            currency = entries.empty() ? domain::SellerBalance::DEFAULT_CURRENCY : entries.front().currency();
        }

        std::map<std::string, domain::EscrowAllocation> allocations;
        if (!activeAllocations.empty()) {
            for (auto& allocation : escrowRepository_->findAllocationsByStore(storeId)) {
                std::string id = allocation.id();
                allocations.emplace(id, std::move(allocation));
            }
        }

        auto settlement = domain::Settlement::create(storeId, period.year, period.month, currency);

        for (const auto& allocationId : activeAllocations) {
            if (isCancelled(cancellation)) {
                return std::nullopt;
            }

            auto it = allocations.find(allocationId);
            if (it == allocations.end()) {
                throw domain::NotFoundException("Allocation " + allocationId + " not found for store " + storeId + ".");
            }

            auto item = domain::buildSettlementItem(settlement.id(), it->second, byAllocation[allocationId], period);
            if (item) {
                settlement.addItem(*item);
            }
        }

        return settlement;
    }

    template<typename Mutation>
    domain::Settlement mutate(const std::string& settlementId, Mutation&& mutation) {
        return coordinator_->execute("settlement:" + settlementId, [&] {
            auto settlement = loadSettlement(settlementId);
            mutation(settlement);
            settlementRepository_->update(settlement);

            std::cout << "[SettlementService] " << settlement.settlementNumber() << " is now "
                      << domain::toString(settlement.status()) << std::endl;
            return settlement;
        });
    }

    domain::Settlement loadSettlement(const std::string& settlementId) {
        auto settlement = settlementRepository_->findById(settlementId);
        if (!settlement) {
            throw domain::NotFoundException("Settlement " + settlementId + " not found.");
        }
        return std::move(*settlement);
    }

    static bool isCancelled(const utils::CancellationToken* cancellation) {
        return cancellation != nullptr && cancellation->isCancelled();
    }

    void publish(const std::string& routingKey, nlohmann::json event) {
        try {
            event["timestamp"] = domain::Timestamp::now().toString();
            eventPublisher_->publish(routingKey, event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[SettlementService] Failed to publish " << routingKey << ": " << e.what() << std::endl;
        }
    }
};

} // namespace escrow::application
