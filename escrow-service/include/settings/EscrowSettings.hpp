#pragma once

#include "settings/IEscrowSettings.hpp"
#include "settings/EnvReader.hpp"
#include <string>
#include <stdexcept>
#include <thread>

namespace escrow::settings {

/**
 * @brief Настройки escrow-сервиса
 *
 * Читает из ENV:
 * - ESCROW_LOCK_TIMEOUT_MS (default: 2000)
 * - ESCROW_DEFAULT_COMMISSION_RATE (default: 10, проценты 0..100)
 * - ESCROW_STORAGE (default: "postgres", либо "memory")
 * - ESCROW_SETTLEMENT_WORKERS (default: число ядер)
 */
class EscrowSettings : public IEscrowSettings {
public:
    EscrowSettings()
        : lockTimeout_(env::integer("ESCROW_LOCK_TIMEOUT_MS", 2000, 1, 600000))
        , defaultCommissionPercent_(env::decimal("ESCROW_DEFAULT_COMMISSION_RATE", 10.0, 0.0, 100.0))
        , storage_(env::text("ESCROW_STORAGE", "postgres"))
        , settlementWorkers_(static_cast<size_t>(
              env::integer("ESCROW_SETTLEMENT_WORKERS", defaultWorkers(), 1, 256)))
    {
        if (storage_ != "postgres" && storage_ != "memory") {
            throw std::invalid_argument("ESCROW_STORAGE must be 'postgres' or 'memory': " + storage_);
        }
    }

    std::chrono::milliseconds getLockTimeout() const override { return lockTimeout_; }
    double getDefaultCommissionPercent() const override { return defaultCommissionPercent_; }
    std::string getStorage() const override { return storage_; }
    size_t getSettlementWorkers() const override { return settlementWorkers_; }

private:
    static long long defaultWorkers() {
        unsigned int cores = std::thread::hardware_concurrency();
        return cores > 0 ? static_cast<long long>(cores) : 1;
    }

    std::chrono::milliseconds lockTimeout_;
    double defaultCommissionPercent_;
    std::string storage_;
    size_t settlementWorkers_;
};

} // namespace escrow::settings
