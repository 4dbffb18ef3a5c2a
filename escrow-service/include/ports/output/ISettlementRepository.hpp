#pragma once

#include "domain/Settlement.hpp"
#include <optional>
#include <string>
#include <vector>

namespace escrow::ports::output {

/**
 * @brief Хранилище расчётных ведомостей
 *
 * Строки ведомости записываются один раз вместе с ней самой;
 * после этого ведомость только дополняется корректировками.
 */
class ISettlementRepository {
public:
    virtual ~ISettlementRepository() = default;

    /**
     * @brief Сохранить ведомость со всеми строками одной транзакцией
     * @throws ContentionException ведомость за этот период уже существует
     */
    virtual void insert(const domain::Settlement& settlement) = 0;

    /**
     * @brief Обновить статус, заметки и данные согласования
     */
    virtual void update(const domain::Settlement& settlement) = 0;

    virtual void addAdjustment(const domain::SettlementAdjustment& adjustment) = 0;

    virtual std::optional<domain::Settlement> findById(const std::string& settlementId) = 0;

    virtual std::optional<domain::Settlement> findByStoreAndPeriod(
        const std::string& storeId, int year, int month) = 0;

    virtual std::vector<domain::Settlement> listByStore(const std::string& storeId) = 0;
};

} // namespace escrow::ports::output
