#pragma once

#include "settings/IEscrowSettings.hpp"

namespace escrow::tests {

/**
 * @brief Настройки для тестов без чтения ENV
 */
class TestEscrowSettings : public settings::IEscrowSettings {
public:
    explicit TestEscrowSettings(std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(2000),
                                size_t workers = 4)
        : lockTimeout_(lockTimeout), workers_(workers) {}

    std::chrono::milliseconds getLockTimeout() const override { return lockTimeout_; }
    double getDefaultCommissionPercent() const override { return 10.0; }
    std::string getStorage() const override { return "memory"; }
    size_t getSettlementWorkers() const override { return workers_; }

private:
    std::chrono::milliseconds lockTimeout_;
    size_t workers_;
};

} // namespace escrow::tests
