#pragma once

#include "domain/Settlement.hpp"
#include "utils/CancellationToken.hpp"
#include <vector>
#include <optional>
#include <string>

namespace escrow::ports::input {

/**
 * @brief Итог закрытия периода по одному магазину
 */
struct SettlementCloseResult {
    std::string storeId;
    std::optional<domain::Settlement> settlement;
    bool cancelled = false;
    std::string error;

    bool succeeded() const { return settlement.has_value(); }
};

/**
 * @brief Интерфейс сервиса расчётных ведомостей
 */
class ISettlementService {
public:
    virtual ~ISettlementService() = default;

    /**
     * @brief Закрыть период для магазина
     *
     * Идемпотентно: если ведомость за период уже есть, она возвращается без изменений.
     */
    virtual domain::Settlement closeSettlementPeriod(const std::string& storeId, int year, int month) = 0;

    /**
     * @brief Закрыть период для всех магазинов с движениями, параллельно
     *
     * Отменённая ведомость не сохраняется целиком.
     */
    virtual std::vector<SettlementCloseResult> closeAllSettlements(
        int year, int month, const utils::CancellationToken& cancellation) = 0;

    virtual domain::Settlement recordAdjustment(
        const std::string& settlementId,
        int originalYear,
        int originalMonth,
        const domain::Money& amount,
        const std::string& reason,
        const std::optional<std::string>& relatedOrderId = std::nullopt,
        const std::optional<std::string>& relatedOrderNumber = std::nullopt) = 0;

    virtual domain::Settlement approveSettlement(const std::string& settlementId, const std::string& approvedBy) = 0;

    virtual domain::Settlement markExported(const std::string& settlementId) = 0;

    virtual domain::Settlement updateNotes(const std::string& settlementId, const std::string& notes) = 0;

    virtual std::optional<domain::Settlement> getSettlement(const std::string& settlementId) = 0;

    virtual std::optional<domain::Settlement> findSettlement(const std::string& storeId, int year, int month) = 0;

    virtual std::vector<domain::Settlement> listSettlements(const std::string& storeId) = 0;
};

} // namespace escrow::ports::input
