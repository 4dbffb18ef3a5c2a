#pragma once

#include "ports/output/IEscrowRepository.hpp"
#include "domain/EscrowErrors.hpp"
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <algorithm>
#include <set>

namespace escrow::adapters::secondary {

/**
 * @brief In-memory реализация хранилища escrow
 *
 * Платежи, индексы и журнал защищены одним shared_mutex, поэтому
 * commit() меняет платёж и дописывает журнал атомарно для читателей.
 */
class InMemoryEscrowRepository : public ports::output::IEscrowRepository {
public:
    void insert(const domain::EscrowPayment& payment,
                const std::vector<domain::LedgerEntry>& entries) override
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        if (orderIndex_.count(payment.orderId()) > 0) {
            throw domain::ContentionException("Escrow for order " + payment.orderId() + " already exists.");
        }
        if (payments_.count(payment.id()) > 0) {
            throw domain::ContentionException("Escrow " + payment.id() + " already exists.");
        }

        payments_.emplace(payment.id(), payment);
        orderIndex_[payment.orderId()] = payment.id();
        for (const auto& allocation : payment.allocations()) {
            allocationIndex_[allocation.id()] = payment.id();
        }
        append(entries);
    }

    void commit(const domain::EscrowPayment& payment,
                int64_t expectedVersion,
                const std::vector<domain::LedgerEntry>& entries) override
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = payments_.find(payment.id());
        if (it == payments_.end()) {
            throw domain::NotFoundException("Escrow " + payment.id() + " not found.");
        }
        if (it->second.version() != expectedVersion) {
            throw domain::ContentionException(
                "Escrow " + payment.id() + " was modified concurrently (expected version "
                + std::to_string(expectedVersion) + ", found " + std::to_string(it->second.version()) + ").");
        }

        it->second = payment;
        for (const auto& allocation : payment.allocations()) {
            allocationIndex_[allocation.id()] = payment.id();
        }
        append(entries);
    }

    std::optional<domain::EscrowPayment> findById(const std::string& escrowPaymentId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = payments_.find(escrowPaymentId);
        if (it == payments_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::EscrowPayment> findByOrderId(const std::string& orderId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = orderIndex_.find(orderId);
        if (it == orderIndex_.end()) return std::nullopt;
        return payments_.at(it->second);
    }

    std::optional<std::string> findPaymentIdByAllocation(const std::string& allocationId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = allocationIndex_.find(allocationId);
        if (it == allocationIndex_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::EscrowAllocation> findAllocationsByStore(const std::string& storeId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::EscrowAllocation> result;
        for (const auto& [id, payment] : payments_) {
            for (const auto& allocation : payment.allocations()) {
                if (allocation.storeId() == storeId) {
                    result.push_back(allocation);
                }
            }
        }

        std::sort(result.begin(), result.end(),
            [](const domain::EscrowAllocation& a, const domain::EscrowAllocation& b) {
                return a.createdAt() < b.createdAt();
            });
        return result;
    }

    std::vector<domain::LedgerEntry> getLedger(const std::string& escrowPaymentId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = ledger_.find(escrowPaymentId);
        if (it == ledger_.end()) return {};
        return sorted(it->second);
    }

    std::vector<domain::LedgerEntry> getLedgerByStore(const std::string& storeId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::LedgerEntry> result;
        for (const auto& [paymentId, entries] : ledger_) {
            for (const auto& entry : entries) {
                if (entry.storeId() && *entry.storeId() == storeId) {
                    result.push_back(entry);
                }
            }
        }
        return sorted(std::move(result));
    }

    int64_t lastLedgerSequence(const std::string& escrowPaymentId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = ledger_.find(escrowPaymentId);
        if (it == ledger_.end()) return 0;

        int64_t last = 0;
        for (const auto& entry : it->second) {
            last = std::max(last, entry.sequence());
        }
        return last;
    }

    std::vector<std::string> findStoresWithActivity(const domain::Timestamp& from,
                                                    const domain::Timestamp& to) override
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::set<std::string> stores;
        for (const auto& [paymentId, entries] : ledger_) {
            for (const auto& entry : entries) {
                if (!entry.storeId()) continue;
                if (!domain::isReleaseAction(entry.action()) && !domain::isRefundAction(entry.action())) continue;
                if (entry.createdAt() >= from && entry.createdAt() < to) {
                    stores.insert(*entry.storeId());
                }
            }
        }
        return {stores.begin(), stores.end()};
    }

private:
    // Вызывается под unique_lock
    void append(const std::vector<domain::LedgerEntry>& entries) {
        for (const auto& entry : entries) {
            ledger_[entry.escrowPaymentId()].push_back(entry);
        }
    }

    static std::vector<domain::LedgerEntry> sorted(std::vector<domain::LedgerEntry> entries) {
        std::stable_sort(entries.begin(), entries.end());
        return entries;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, domain::EscrowPayment> payments_;
    std::unordered_map<std::string, std::string> orderIndex_;
    std::unordered_map<std::string, std::string> allocationIndex_;
    std::unordered_map<std::string, std::vector<domain::LedgerEntry>> ledger_;
};

} // namespace escrow::adapters::secondary
