// include/adapters/secondary/persistence/PostgresSettlementRepository.hpp
#pragma once

#include "ports/output/ISettlementRepository.hpp"
#include "domain/EscrowErrors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace escrow::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища ведомостей
 *
 * Таблицы:
 * - settlements (UNIQUE (store_id, year, month))
 * - settlement_items (UNIQUE (settlement_id, escrow_allocation_id))
 * - settlement_adjustments
 */
class PostgresSettlementRepository : public ports::output::ISettlementRepository {
public:
    explicit PostgresSettlementRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void insert(const domain::Settlement& settlement) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            const auto& s = settlement.data();
            txn.exec_params(
                "INSERT INTO settlements (id, store_id, year, month, settlement_number, currency, status, "
                "approved_by, approved_at, exported_at, notes, created_at, updated_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13)",
                s.id, s.storeId, s.year, s.month, s.settlementNumber, s.currency,
                domain::toString(s.status), s.approvedBy, millis(s.approvedAt), millis(s.exportedAt),
                s.notes, s.createdAt.toUnixMillis(), s.updatedAt.toUnixMillis()
            );

            for (const auto& item : settlement.items()) {
                const auto& i = item.data();
                txn.exec_params(
                    "INSERT INTO settlement_items (id, settlement_id, escrow_allocation_id, shipment_id, "
                    "order_number, seller_amount, shipping_amount, commission_amount, refunded_amount, "
                    "net_amount, transaction_date) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)",
                    i.id, i.settlementId, i.escrowAllocationId, i.shipmentId, i.orderNumber,
                    i.sellerAmount.minorUnits(), i.shippingAmount.minorUnits(),
                    i.commissionAmount.minorUnits(), i.refundedAmount.minorUnits(),
                    i.netAmount.minorUnits(), i.transactionDate.toUnixMillis()
                );
            }

            for (const auto& adjustment : settlement.adjustments()) {
                insertAdjustment(txn, adjustment);
            }

            txn.commit();
            std::cout << "[PostgresSettlementRepository] Inserted " << settlement.settlementNumber()
                      << " with " << settlement.items().size() << " item(s)" << std::endl;

        } catch (const pqxx::unique_violation&) {
            throw domain::ContentionException("Settlement " + settlement.settlementNumber() + " already exists.");
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettlementRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    void update(const domain::Settlement& settlement) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            const auto& s = settlement.data();
            auto result = txn.exec_params(
                "UPDATE settlements "
                "SET status = $2, approved_by = $3, approved_at = $4, exported_at = $5, "
                "    notes = $6, updated_at = $7 "
                "WHERE id = $1 "
                "RETURNING id",
                s.id, domain::toString(s.status), s.approvedBy, millis(s.approvedAt),
                millis(s.exportedAt), s.notes, s.updatedAt.toUnixMillis()
            );

            if (result.empty()) {
                throw domain::NotFoundException("Settlement " + s.id + " not found.");
            }

            txn.commit();

        } catch (const domain::EscrowException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettlementRepository] update error: " << e.what() << std::endl;
            throw;
        }
    }

    void addAdjustment(const domain::SettlementAdjustment& adjustment) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            insertAdjustment(txn, adjustment);
            txn.exec_params(
                "UPDATE settlements SET updated_at = $2 WHERE id = $1",
                adjustment.settlementId(), adjustment.createdAt().toUnixMillis()
            );

            txn.commit();

        } catch (const pqxx::foreign_key_violation&) {
            throw domain::NotFoundException("Settlement " + adjustment.settlementId() + " not found.");
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettlementRepository] addAdjustment error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Settlement> findById(const std::string& settlementId) override {
        auto found = query("findById", "WHERE id = $1", settlementId);
        if (found.empty()) return std::nullopt;
        return std::move(found.front());
    }

    std::optional<domain::Settlement> findByStoreAndPeriod(
        const std::string& storeId, int year, int month) override
    {
        auto found = query("findByStoreAndPeriod",
            "WHERE store_id = $1 AND year * 100 + month = $2", storeId, year * 100 + month);
        if (found.empty()) return std::nullopt;
        return std::move(found.front());
    }

    std::vector<domain::Settlement> listByStore(const std::string& storeId) override {
        return query("listByStore", "WHERE store_id = $1 ORDER BY year DESC, month DESC", storeId);
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    template<typename... Params>
    std::vector<domain::Settlement> query(const char* operation, const std::string& where, Params&&... params) {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto rows = txn.exec_params(
                "SELECT id, store_id, year, month, settlement_number, currency, status, approved_by, "
                "approved_at, exported_at, notes, created_at, updated_at FROM settlements " + where,
                std::forward<Params>(params)...
            );

            std::vector<domain::Settlement> settlements;
            for (const auto& row : rows) {
                domain::Settlement::Data data;
                data.id = row["id"].as<std::string>();
                data.storeId = row["store_id"].as<std::string>();
                data.year = row["year"].as<int>();
                data.month = row["month"].as<int>();
                data.settlementNumber = row["settlement_number"].as<std::string>();
                data.currency = row["currency"].as<std::string>();
                data.status = domain::parseSettlementStatus(row["status"].as<std::string>());
                data.approvedBy = optionalText(row["approved_by"]);
                data.approvedAt = optionalTimestamp(row["approved_at"]);
                data.exportedAt = optionalTimestamp(row["exported_at"]);
                data.notes = optionalText(row["notes"]);
                data.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
                data.updatedAt = domain::Timestamp::fromUnixMillis(row["updated_at"].as<int64_t>());

                auto items = loadItems(txn, data.id, data.currency);
                auto adjustments = loadAdjustments(txn, data.id, data.currency);
                settlements.push_back(domain::Settlement::restore(
                    std::move(data), std::move(items), std::move(adjustments)));
            }

            txn.commit();
            return settlements;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettlementRepository] " << operation << " error: " << e.what() << std::endl;
            throw;
        }
    }

    static std::vector<domain::SettlementItem> loadItems(
        pqxx::work& txn, const std::string& settlementId, const std::string& currency)
    {
        auto rows = txn.exec_params(
            "SELECT id, settlement_id, escrow_allocation_id, shipment_id, order_number, seller_amount, "
            "shipping_amount, commission_amount, refunded_amount, net_amount, transaction_date "
            "FROM settlement_items WHERE settlement_id = $1 ORDER BY transaction_date, id",
            settlementId
        );

        std::vector<domain::SettlementItem> items;
        for (const auto& row : rows) {
            domain::SettlementItem::Data data;
            data.id = row["id"].as<std::string>();
            data.settlementId = row["settlement_id"].as<std::string>();
            data.escrowAllocationId = row["escrow_allocation_id"].as<std::string>();
            data.shipmentId = optionalText(row["shipment_id"]);
            data.orderNumber = row["order_number"].as<std::string>();
            data.sellerAmount = domain::Money::fromMinor(row["seller_amount"].as<int64_t>(), currency);
            data.shippingAmount = domain::Money::fromMinor(row["shipping_amount"].as<int64_t>(), currency);
            data.commissionAmount = domain::Money::fromMinor(row["commission_amount"].as<int64_t>(), currency);
            data.refundedAmount = domain::Money::fromMinor(row["refunded_amount"].as<int64_t>(), currency);
            data.netAmount = domain::Money::fromMinor(row["net_amount"].as<int64_t>(), currency);
            data.transactionDate = domain::Timestamp::fromUnixMillis(row["transaction_date"].as<int64_t>());
            items.push_back(domain::SettlementItem::restore(std::move(data)));
        }
        return items;
    }

    static std::vector<domain::SettlementAdjustment> loadAdjustments(
        pqxx::work& txn, const std::string& settlementId, const std::string& currency)
    {
        auto rows = txn.exec_params(
            "SELECT id, settlement_id, original_year, original_month, amount, reason, "
            "related_order_id, related_order_number, created_at "
            "FROM settlement_adjustments WHERE settlement_id = $1 ORDER BY created_at, id",
            settlementId
        );

        std::vector<domain::SettlementAdjustment> adjustments;
        for (const auto& row : rows) {
            domain::SettlementAdjustment::Data data;
            data.id = row["id"].as<std::string>();
            data.settlementId = row["settlement_id"].as<std::string>();
            data.originalYear = row["original_year"].as<int>();
            data.originalMonth = row["original_month"].as<int>();
            data.amount = domain::Money::fromMinor(row["amount"].as<int64_t>(), currency);
            data.reason = row["reason"].as<std::string>();
            data.relatedOrderId = optionalText(row["related_order_id"]);
            data.relatedOrderNumber = optionalText(row["related_order_number"]);
            data.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
            adjustments.push_back(domain::SettlementAdjustment::restore(std::move(data)));
        }
        return adjustments;
    }

    static void insertAdjustment(pqxx::work& txn, const domain::SettlementAdjustment& adjustment) {
        const auto& a = adjustment.data();
        txn.exec_params(
            "INSERT INTO settlement_adjustments (id, settlement_id, original_year, original_month, "
            "amount, reason, related_order_id, related_order_number, created_at) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)",
            a.id, a.settlementId, a.originalYear, a.originalMonth, a.amount.minorUnits(),
            a.reason, a.relatedOrderId, a.relatedOrderNumber, a.createdAt.toUnixMillis()
        );
    }

    static std::optional<domain::Timestamp> optionalTimestamp(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return domain::Timestamp::fromUnixMillis(field.as<int64_t>());
    }

    static std::optional<std::string> optionalText(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return field.as<std::string>();
    }

    static std::optional<int64_t> millis(const std::optional<domain::Timestamp>& ts) {
        if (!ts) return std::nullopt;
        return ts->toUnixMillis();
    }

    void initSchema() {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS settlements (
                    id VARCHAR(64) PRIMARY KEY,
                    store_id VARCHAR(64) NOT NULL,
                    year INTEGER NOT NULL,
                    month INTEGER NOT NULL CHECK (month BETWEEN 1 AND 12),
                    settlement_number VARCHAR(32) NOT NULL,
                    currency VARCHAR(3) NOT NULL,
                    status VARCHAR(16) NOT NULL,
                    approved_by VARCHAR(128),
                    approved_at BIGINT,
                    exported_at BIGINT,
                    notes VARCHAR(500),
                    created_at BIGINT NOT NULL,
                    updated_at BIGINT NOT NULL,
                    UNIQUE (store_id, year, month)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS settlement_items (
                    id VARCHAR(64) PRIMARY KEY,
                    settlement_id VARCHAR(64) NOT NULL REFERENCES settlements(id),
                    escrow_allocation_id VARCHAR(64) NOT NULL,
                    shipment_id VARCHAR(64),
                    order_number VARCHAR(64) NOT NULL,
                    seller_amount BIGINT NOT NULL,
                    shipping_amount BIGINT NOT NULL,
                    commission_amount BIGINT NOT NULL,
                    refunded_amount BIGINT NOT NULL,
                    net_amount BIGINT NOT NULL,
                    transaction_date BIGINT NOT NULL,
                    UNIQUE (settlement_id, escrow_allocation_id)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS settlement_adjustments (
                    id VARCHAR(64) PRIMARY KEY,
                    settlement_id VARCHAR(64) NOT NULL REFERENCES settlements(id),
                    original_year INTEGER NOT NULL,
                    original_month INTEGER NOT NULL,
                    amount BIGINT NOT NULL,
                    reason VARCHAR(500) NOT NULL,
                    related_order_id VARCHAR(64),
                    related_order_number VARCHAR(64),
                    created_at BIGINT NOT NULL
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_settlement_adjustments_settlement "
                     "ON settlement_adjustments (settlement_id)");

            txn.commit();
            std::cout << "[PostgresSettlementRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresSettlementRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace escrow::adapters::secondary
