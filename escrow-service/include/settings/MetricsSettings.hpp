#pragma once

#include "IMetricsSettings.hpp"
#include <vector>
#include <string>

namespace escrow::settings {

/**
 * @brief Настройки метрик для Escrow Service
 *
 * - HTTP метрики (запросы к endpoints)
 * - Event метрики (события из RabbitMQ)
 * - Бизнес метрики (escrow, выплаты, ведомости)
 */
class MetricsSettings : public IMetricsSettings {
public:
    std::vector<MetricDefinition> getDefinitions() const override {
        return {
            {"http_requests_total", "Total HTTP requests", "counter"},
            {"events_received_total", "Total events received from RabbitMQ", "counter"},
            {"escrows_created_total", "Total escrow payments created", "counter"},
            {"allocations_eligible_total", "Total allocations marked eligible", "counter"},
            {"escrow_releases_total", "Total release operations", "counter"},
            {"escrow_refunds_total", "Total refund operations", "counter"},
            {"escrow_contention_total", "Total lock or version conflicts", "counter"},
            {"escrow_invariant_violations_total", "Total insufficient escrow balance alerts", "counter"},
            {"settlements_closed_total", "Total settlements closed", "counter"},
            {"settlement_adjustments_total", "Total settlement adjustments recorded", "counter"}
        };
    }

    std::vector<std::string> getAllKeys() const override {
        return {
            // ============================================
            // HTTP метрики (method + path)
            // ============================================

            // Health & Metrics
            "http_requests_total{method=\"GET\",path=\"/health\"}",
            "http_requests_total{method=\"GET\",path=\"/metrics\"}",

            // Escrow queries
            "http_requests_total{method=\"GET\",path=\"/api/v1/escrows\"}",
            "http_requests_total{method=\"GET\",path=\"/api/v1/stores\"}",

            // Allocation commands
            "http_requests_total{method=\"POST\",path=\"/api/v1/allocations\"}",

            // Settlements
            "http_requests_total{method=\"GET\",path=\"/api/v1/settlements\"}",
            "http_requests_total{method=\"POST\",path=\"/api/v1/settlements\"}",

            // ============================================
            // Event метрики (routing key)
            // ============================================
            "events_received_total{event=\"order.payment_confirmed\"}",
            "events_received_total{event=\"shipment.delivered\"}",
            "events_received_total{event=\"payout.requested\"}",
            "events_received_total{event=\"refund.requested\"}",
            "events_received_total{event=\"settlement.period_ended\"}",

            // ============================================
            // Бизнес метрики (без labels)
            // ============================================
            "escrows_created_total",
            "allocations_eligible_total",
            "escrow_releases_total",
            "escrow_refunds_total",
            "escrow_contention_total",
            "escrow_invariant_violations_total",
            "settlements_closed_total",
            "settlement_adjustments_total"
        };
    }
};

} // namespace escrow::settings
