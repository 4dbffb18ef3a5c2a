#pragma once

#include <string>
#include <vector>

namespace escrow::settings {

/**
 * @brief Определение метрики для Prometheus
 */
struct MetricDefinition {
    std::string name;   ///< Имя метрики (например, "http_requests_total")
    std::string help;   ///< Описание метрики для HELP
    std::string type;   ///< Тип метрики: "counter", "gauge", "histogram"
};

/**
 * @brief Интерфейс настроек метрик
 *
 * Ключи из getAllKeys() заводятся нулями при старте, чтобы серии
 * были видны в /metrics до первого события.
 */
class IMetricsSettings {
public:
    virtual ~IMetricsSettings() = default;

    /**
     * @brief Определения метрик для HELP и TYPE
     */
    virtual std::vector<MetricDefinition> getDefinitions() const = 0;

    // "metric_name{label1=\"value1\",label2=\"value2\"}"
    virtual std::vector<std::string> getAllKeys() const = 0;
};

} // namespace escrow::settings
