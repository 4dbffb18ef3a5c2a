#pragma once

#include "ports/output/ISettlementRepository.hpp"
#include "domain/EscrowErrors.hpp"
#include <unordered_map>
#include <map>
#include <shared_mutex>
#include <mutex>
#include <algorithm>

namespace escrow::adapters::secondary {

/**
 * @brief In-memory реализация хранилища ведомостей
 */
class InMemorySettlementRepository : public ports::output::ISettlementRepository {
public:
    void insert(const domain::Settlement& settlement) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto key = periodKey(settlement.storeId(), settlement.year(), settlement.month());
        if (periodIndex_.count(key) > 0) {
            throw domain::ContentionException("Settlement " + settlement.settlementNumber() + " already exists.");
        }

        settlements_.emplace(settlement.id(), settlement);
        periodIndex_[key] = settlement.id();
    }

    void update(const domain::Settlement& settlement) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = settlements_.find(settlement.id());
        if (it == settlements_.end()) {
            throw domain::NotFoundException("Settlement " + settlement.id() + " not found.");
        }

        // Строки и корректировки не перезаписываются
        it->second = domain::Settlement::restore(
            settlement.data(), it->second.items(), it->second.adjustments());
    }

    void addAdjustment(const domain::SettlementAdjustment& adjustment) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = settlements_.find(adjustment.settlementId());
        if (it == settlements_.end()) {
            throw domain::NotFoundException("Settlement " + adjustment.settlementId() + " not found.");
        }

        auto adjustments = it->second.adjustments();
        adjustments.push_back(adjustment);
        it->second = domain::Settlement::restore(it->second.data(), it->second.items(), std::move(adjustments));
    }

    std::optional<domain::Settlement> findById(const std::string& settlementId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = settlements_.find(settlementId);
        if (it == settlements_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::Settlement> findByStoreAndPeriod(
        const std::string& storeId, int year, int month) override
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = periodIndex_.find(periodKey(storeId, year, month));
        if (it == periodIndex_.end()) return std::nullopt;
        return settlements_.at(it->second);
    }

    std::vector<domain::Settlement> listByStore(const std::string& storeId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<domain::Settlement> result;
        for (const auto& [id, settlement] : settlements_) {
            if (settlement.storeId() == storeId) {
                result.push_back(settlement);
            }
        }

        // Новые периоды первыми
        std::sort(result.begin(), result.end(),
            [](const domain::Settlement& a, const domain::Settlement& b) {
                return b.period() < a.period();
            });
        return result;
    }

private:
    static std::string periodKey(const std::string& storeId, int year, int month) {
        return storeId + ":" + std::to_string(year * 100 + month);
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, domain::Settlement> settlements_;
    std::unordered_map<std::string, std::string> periodIndex_;
};

} // namespace escrow::adapters::secondary
