#pragma once

#include <string>
#include <chrono>
#include <cstddef>

namespace escrow::settings {

/**
 * @brief Параметры бизнес-логики escrow
 */
class IEscrowSettings {
public:
    virtual ~IEscrowSettings() = default;

    /**
     * @brief Сколько ждать блокировку платежа до ContentionException
     */
    virtual std::chrono::milliseconds getLockTimeout() const = 0;

    /**
     * @brief Ставка комиссии (в процентах), если событие её не содержит
     */
    virtual double getDefaultCommissionPercent() const = 0;

    /**
     * @brief "postgres" или "memory"
     */
    virtual std::string getStorage() const = 0;

    /**
     * @brief Сколько ведомостей закрывать параллельно
     */
    virtual size_t getSettlementWorkers() const = 0;
};

} // namespace escrow::settings
