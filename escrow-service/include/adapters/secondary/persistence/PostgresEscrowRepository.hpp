// include/adapters/secondary/persistence/PostgresEscrowRepository.hpp
#pragma once

#include "ports/output/IEscrowRepository.hpp"
#include "domain/EscrowErrors.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace escrow::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища escrow
 *
 * Таблицы:
 * - escrow_payments (id PK, order_id UNIQUE, version для CAS)
 * - escrow_allocations (id PK, escrow_payment_id FK)
 * - escrow_ledger (только INSERT, UNIQUE (escrow_payment_id, sequence))
 *
 * Суммы хранятся в BIGINT (минорные единицы), ставка комиссии в единицах
 * 1/10000 процента, время в миллисекундах Unix (UTC).
 */
class PostgresEscrowRepository : public ports::output::IEscrowRepository {
public:
    explicit PostgresEscrowRepository(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        initSchema();
    }

    void insert(const domain::EscrowPayment& payment,
                const std::vector<domain::LedgerEntry>& entries) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            const auto& p = payment.data();
            txn.exec_params(
                "INSERT INTO escrow_payments (id, order_id, buyer_id, total_amount, currency, "
                "payment_transaction_id, released_amount, refunded_amount, status, version, "
                "created_at, updated_at, released_at, refunded_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14)",
                p.id, p.orderId, p.buyerId, p.totalAmount.minorUnits(), payment.currency(),
                p.paymentTransactionId, p.releasedAmount.minorUnits(), p.refundedAmount.minorUnits(),
                domain::toString(p.status), p.version,
                p.createdAt.toUnixMillis(), p.updatedAt.toUnixMillis(),
                millis(p.releasedAt), millis(p.refundedAt)
            );

            for (const auto& allocation : payment.allocations()) {
                upsertAllocation(txn, allocation);
            }
            appendEntries(txn, entries);

            txn.commit();
            std::cout << "[PostgresEscrowRepository] Inserted escrow " << payment.id()
                      << " for order " << payment.orderId() << std::endl;

        } catch (const pqxx::unique_violation&) {
            throw domain::ContentionException("Escrow for order " + payment.orderId() + " already exists.");
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEscrowRepository] insert error: " << e.what() << std::endl;
            throw;
        }
    }

    void commit(const domain::EscrowPayment& payment,
                int64_t expectedVersion,
                const std::vector<domain::LedgerEntry>& entries) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            const auto& p = payment.data();

            // Compare-and-swap по версии
            auto result = txn.exec_params(
                "UPDATE escrow_payments "
                "SET released_amount = $3, refunded_amount = $4, status = $5, version = $6, "
                "    updated_at = $7, released_at = $8, refunded_at = $9 "
                "WHERE id = $1 AND version = $2 "
                "RETURNING id",
                p.id, expectedVersion,
                p.releasedAmount.minorUnits(), p.refundedAmount.minorUnits(),
                domain::toString(p.status), p.version,
                p.updatedAt.toUnixMillis(), millis(p.releasedAt), millis(p.refundedAt)
            );

            if (result.empty()) {
                // Транзакция откатывается в деструкторе
                throw domain::ContentionException(
                    "Escrow " + p.id + " was modified concurrently (expected version "
                    + std::to_string(expectedVersion) + ").");
            }

            for (const auto& allocation : payment.allocations()) {
                upsertAllocation(txn, allocation);
            }
            appendEntries(txn, entries);

            txn.commit();

        } catch (const domain::ContentionException&) {
            throw;
        } catch (const pqxx::unique_violation&) {
            throw domain::ContentionException("Ledger sequence conflict for escrow " + payment.id() + ".");
        } catch (const std::exception& e) {
            std::cerr << "[PostgresEscrowRepository] commit error: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::EscrowPayment> findById(const std::string& escrowPaymentId) override {
        return findOne("findById", "id", escrowPaymentId);
    }

    std::optional<domain::EscrowPayment> findByOrderId(const std::string& orderId) override {
        return findOne("findByOrderId", "order_id", orderId);
    }

    std::optional<std::string> findPaymentIdByAllocation(const std::string& allocationId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::nontransaction txn(conn);

            auto result = txn.exec_params(
                "SELECT escrow_payment_id FROM escrow_allocations WHERE id = $1",
                allocationId
            );
            if (result.empty()) {
                return std::nullopt;
            }
            return result[0]["escrow_payment_id"].as<std::string>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresEscrowRepository] findPaymentIdByAllocation error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::EscrowAllocation> findAllocationsByStore(const std::string& storeId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::nontransaction txn(conn);

            auto result = txn.exec_params(
                "SELECT " + ALLOCATION_COLUMNS + " FROM escrow_allocations "
                "WHERE store_id = $1 ORDER BY created_at, id",
                storeId
            );

            std::vector<domain::EscrowAllocation> allocations;
            for (const auto& row : result) {
                allocations.push_back(mapAllocation(row));
            }
            return allocations;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresEscrowRepository] findAllocationsByStore error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::LedgerEntry> getLedger(const std::string& escrowPaymentId) override {
        return queryLedger("getLedger",
            "WHERE escrow_payment_id = $1 ORDER BY created_at, sequence", escrowPaymentId);
    }

    std::vector<domain::LedgerEntry> getLedgerByStore(const std::string& storeId) override {
        return queryLedger("getLedgerByStore",
            "WHERE store_id = $1 ORDER BY created_at, sequence", storeId);
    }

    int64_t lastLedgerSequence(const std::string& escrowPaymentId) override {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::nontransaction txn(conn);

            auto result = txn.exec_params(
                "SELECT COALESCE(MAX(sequence), 0) AS last FROM escrow_ledger WHERE escrow_payment_id = $1",
                escrowPaymentId
            );
            return result[0]["last"].as<int64_t>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresEscrowRepository] lastLedgerSequence error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<std::string> findStoresWithActivity(const domain::Timestamp& from,
                                                    const domain::Timestamp& to) override
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::nontransaction txn(conn);

            auto result = txn.exec_params(
                "SELECT DISTINCT store_id FROM escrow_ledger "
                "WHERE store_id IS NOT NULL "
                "  AND action IN ('PARTIAL_RELEASE', 'RELEASED', 'PARTIAL_REFUND', 'REFUNDED') "
                "  AND created_at >= $1 AND created_at < $2 "
                "ORDER BY store_id",
                from.toUnixMillis(), to.toUnixMillis()
            );

            std::vector<std::string> stores;
            for (const auto& row : result) {
                stores.push_back(row["store_id"].as<std::string>());
            }
            return stores;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresEscrowRepository] findStoresWithActivity error: " << e.what() << std::endl;
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;

    inline static const std::string PAYMENT_COLUMNS =
        "id, order_id, buyer_id, total_amount, currency, payment_transaction_id, "
        "released_amount, refunded_amount, status, version, created_at, updated_at, "
        "released_at, refunded_at";

    inline static const std::string ALLOCATION_COLUMNS =
        "id, escrow_payment_id, store_id, shipment_id, total_amount, shipping_amount, currency, "
        "commission_rate, commission_amount, seller_payout, released_amount, refunded_amount, "
        "status, payout_reference, refund_reference, created_at, updated_at, "
        "eligible_at, released_at, refunded_at";

    inline static const std::string LEDGER_COLUMNS =
        "id, sequence, escrow_payment_id, allocation_id, order_id, store_id, buyer_id, action, "
        "amount, currency, balance_after, external_reference, notes, initiated_by, created_at";

    std::optional<domain::EscrowPayment> findOne(const char* operation,
                                                 const std::string& column,
                                                 const std::string& value)
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::work txn(conn);

            auto result = txn.exec_params(
                "SELECT " + PAYMENT_COLUMNS + " FROM escrow_payments WHERE " + column + " = $1",
                value
            );
            if (result.empty()) {
                return std::nullopt;
            }

            const auto& row = result[0];
            std::string currency = row["currency"].as<std::string>();

            domain::EscrowPayment::Data data;
            data.id = row["id"].as<std::string>();
            data.orderId = row["order_id"].as<std::string>();
            data.buyerId = row["buyer_id"].as<std::string>();
            data.totalAmount = money(row["total_amount"], currency);
            data.paymentTransactionId = row["payment_transaction_id"].as<std::string>();
            data.releasedAmount = money(row["released_amount"], currency);
            data.refundedAmount = money(row["refunded_amount"], currency);
            data.status = domain::parseEscrowStatus(row["status"].as<std::string>());
            data.version = row["version"].as<int64_t>();
            data.createdAt = timestamp(row["created_at"]);
            data.updatedAt = timestamp(row["updated_at"]);
            data.releasedAt = optionalTimestamp(row["released_at"]);
            data.refundedAt = optionalTimestamp(row["refunded_at"]);

            auto allocationRows = txn.exec_params(
                "SELECT " + ALLOCATION_COLUMNS + " FROM escrow_allocations "
                "WHERE escrow_payment_id = $1 ORDER BY created_at, id",
                data.id
            );
            txn.commit();

            std::vector<domain::EscrowAllocation> allocations;
            for (const auto& allocationRow : allocationRows) {
                allocations.push_back(mapAllocation(allocationRow));
            }

            return domain::EscrowPayment::restore(std::move(data), std::move(allocations));

        } catch (const std::exception& e) {
            std::cerr << "[PostgresEscrowRepository] " << operation << " error: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::LedgerEntry> queryLedger(const char* operation,
                                                 const std::string& where,
                                                 const std::string& value)
    {
        try {
            pqxx::connection conn(settings_->getConnectionString());
            pqxx::nontransaction txn(conn);

            auto result = txn.exec_params("SELECT " + LEDGER_COLUMNS + " FROM escrow_ledger " + where, value);

            std::vector<domain::LedgerEntry> entries;
            entries.reserve(result.size());
            for (const auto& row : result) {
                std::string currency = row["currency"].as<std::string>();

                domain::LedgerEntry::Data data;
                data.id = row["id"].as<std::string>();
                data.sequence = row["sequence"].as<int64_t>();
                data.escrowPaymentId = row["escrow_payment_id"].as<std::string>();
                data.allocationId = optionalText(row["allocation_id"]);
                data.orderId = row["order_id"].as<std::string>();
                data.storeId = optionalText(row["store_id"]);
                data.buyerId = row["buyer_id"].as<std::string>();
                data.action = domain::parseLedgerAction(row["action"].as<std::string>());
                data.amount = money(row["amount"], currency);
                data.balanceAfter = money(row["balance_after"], currency);
                data.externalReference = optionalText(row["external_reference"]);
                data.notes = optionalText(row["notes"]);
                data.initiatedBy = row["initiated_by"].as<std::string>();
                data.createdAt = timestamp(row["created_at"]);
                entries.emplace_back(std::move(data));
            }
            return entries;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresEscrowRepository] " << operation << " error: " << e.what() << std::endl;
            throw;
        }
    }

    static void upsertAllocation(pqxx::work& txn, const domain::EscrowAllocation& allocation) {
        const auto& a = allocation.data();
        txn.exec_params(
            "INSERT INTO escrow_allocations (" + ALLOCATION_COLUMNS + ") "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15, $16, $17, $18, $19, $20) "
            "ON CONFLICT (id) DO UPDATE SET "
            "released_amount = EXCLUDED.released_amount, "
            "refunded_amount = EXCLUDED.refunded_amount, "
            "status = EXCLUDED.status, "
            "payout_reference = EXCLUDED.payout_reference, "
            "refund_reference = EXCLUDED.refund_reference, "
            "updated_at = EXCLUDED.updated_at, "
            "eligible_at = EXCLUDED.eligible_at, "
            "released_at = EXCLUDED.released_at, "
            "refunded_at = EXCLUDED.refunded_at",
            a.id, a.escrowPaymentId, a.storeId, a.shipmentId,
            a.totalAmount.minorUnits(), a.shippingAmount.minorUnits(), allocation.currency(),
            a.commissionRate.units(), a.commissionAmount.minorUnits(), a.sellerPayout.minorUnits(),
            a.releasedAmount.minorUnits(), a.refundedAmount.minorUnits(),
            domain::toString(a.status), a.payoutReference, a.refundReference,
            a.createdAt.toUnixMillis(), a.updatedAt.toUnixMillis(),
            millis(a.eligibleAt), millis(a.releasedAt), millis(a.refundedAt)
        );
    }

    static void appendEntries(pqxx::work& txn, const std::vector<domain::LedgerEntry>& entries) {
        for (const auto& entry : entries) {
            const auto& e = entry.data();
            txn.exec_params(
                "INSERT INTO escrow_ledger (" + LEDGER_COLUMNS + ") "
                "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15)",
                e.id, e.sequence, e.escrowPaymentId, e.allocationId, e.orderId, e.storeId, e.buyerId,
                domain::toString(e.action), e.amount.minorUnits(), entry.currency(),
                e.balanceAfter.minorUnits(), e.externalReference, e.notes, e.initiatedBy,
                e.createdAt.toUnixMillis()
            );
        }
    }

    static domain::EscrowAllocation mapAllocation(const pqxx::row& row) {
        std::string currency = row["currency"].as<std::string>();

        domain::EscrowAllocation::Data data;
        data.id = row["id"].as<std::string>();
        data.escrowPaymentId = row["escrow_payment_id"].as<std::string>();
        data.storeId = row["store_id"].as<std::string>();
        data.shipmentId = optionalText(row["shipment_id"]);
        data.totalAmount = money(row["total_amount"], currency);
        data.shippingAmount = money(row["shipping_amount"], currency);
        data.commissionRate = domain::CommissionRate::fromUnits(row["commission_rate"].as<int64_t>());
        data.commissionAmount = money(row["commission_amount"], currency);
        data.sellerPayout = money(row["seller_payout"], currency);
        data.releasedAmount = money(row["released_amount"], currency);
        data.refundedAmount = money(row["refunded_amount"], currency);
        data.status = domain::parseAllocationStatus(row["status"].as<std::string>());
        data.payoutReference = optionalText(row["payout_reference"]);
        data.refundReference = optionalText(row["refund_reference"]);
        data.createdAt = timestamp(row["created_at"]);
        data.updatedAt = timestamp(row["updated_at"]);
        data.eligibleAt = optionalTimestamp(row["eligible_at"]);
        data.releasedAt = optionalTimestamp(row["released_at"]);
        data.refundedAt = optionalTimestamp(row["refunded_at"]);
        return domain::EscrowAllocation::restore(std::move(data));
    }

    static domain::Money money(const pqxx::field& field, const std::string& currency) {
        return domain::Money::fromMinor(field.as<int64_t>(), currency);
    }

    static domain::Timestamp timestamp(const pqxx::field& field) {
        return domain::Timestamp::fromUnixMillis(field.as<int64_t>());
    }

    static std::optional<domain::Timestamp> optionalTimestamp(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return timestamp(field);
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
                CREATE TABLE IF NOT EXISTS escrow_payments (
                    id VARCHAR(64) PRIMARY KEY,
                    order_id VARCHAR(64) NOT NULL UNIQUE,
                    buyer_id VARCHAR(64) NOT NULL,
                    total_amount BIGINT NOT NULL CHECK (total_amount > 0),
                    currency VARCHAR(3) NOT NULL,
                    payment_transaction_id VARCHAR(128) NOT NULL,
                    released_amount BIGINT NOT NULL DEFAULT 0,
                    refunded_amount BIGINT NOT NULL DEFAULT 0,
                    status VARCHAR(32) NOT NULL,
                    version BIGINT NOT NULL,
                    created_at BIGINT NOT NULL,
                    updated_at BIGINT NOT NULL,
                    released_at BIGINT,
                    refunded_at BIGINT,
                    CHECK (released_amount + refunded_amount <= total_amount)
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS escrow_allocations (
                    id VARCHAR(64) PRIMARY KEY,
                    escrow_payment_id VARCHAR(64) NOT NULL REFERENCES escrow_payments(id),
                    store_id VARCHAR(64) NOT NULL,
                    shipment_id VARCHAR(64),
                    total_amount BIGINT NOT NULL,
                    shipping_amount BIGINT NOT NULL DEFAULT 0,
                    currency VARCHAR(3) NOT NULL,
                    commission_rate BIGINT NOT NULL,
                    commission_amount BIGINT NOT NULL,
                    seller_payout BIGINT NOT NULL,
                    released_amount BIGINT NOT NULL DEFAULT 0,
                    refunded_amount BIGINT NOT NULL DEFAULT 0,
                    status VARCHAR(32) NOT NULL,
                    payout_reference VARCHAR(256),
                    refund_reference VARCHAR(256),
                    created_at BIGINT NOT NULL,
                    updated_at BIGINT NOT NULL,
                    eligible_at BIGINT,
                    released_at BIGINT,
                    refunded_at BIGINT
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_escrow_allocations_payment "
                     "ON escrow_allocations (escrow_payment_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_escrow_allocations_store "
                     "ON escrow_allocations (store_id)");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS escrow_ledger (
                    id VARCHAR(64) PRIMARY KEY,
                    sequence BIGINT NOT NULL,
                    escrow_payment_id VARCHAR(64) NOT NULL REFERENCES escrow_payments(id),
                    allocation_id VARCHAR(64),
                    order_id VARCHAR(64) NOT NULL,
                    store_id VARCHAR(64),
                    buyer_id VARCHAR(64) NOT NULL,
                    action VARCHAR(32) NOT NULL,
                    amount BIGINT NOT NULL,
                    currency VARCHAR(3) NOT NULL,
                    balance_after BIGINT NOT NULL,
                    external_reference VARCHAR(256),
                    notes VARCHAR(500),
                    initiated_by VARCHAR(128) NOT NULL,
                    created_at BIGINT NOT NULL,
                    UNIQUE (escrow_payment_id, sequence)
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_escrow_ledger_payment "
                     "ON escrow_ledger (escrow_payment_id, created_at, sequence)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_escrow_ledger_store "
                     "ON escrow_ledger (store_id, created_at)");

            txn.commit();
            std::cout << "[PostgresEscrowRepository] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresEscrowRepository] initSchema error: " << e.what() << std::endl;
        }
    }
};

} // namespace escrow::adapters::secondary
