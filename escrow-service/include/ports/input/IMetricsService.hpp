#pragma once

#include <string>
#include <map>
#include <cstdint>

namespace escrow::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Только counter метрики с опциональными labels, вывод в формате Prometheus.
 *
 * @example
 * ```cpp
 * metricsService->increment("escrow_releases_total");
 * metricsService->increment("http_requests_total", {
 *     {"method", "POST"},
 *     {"path", "/api/v1/allocations"}
 * });
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Инкрементировать счётчик метрики
     *
     * @note Ключ метрики формируется как "name{label1=\"value1\",label2=\"value2\"}"
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Сериализовать метрики в Prometheus text format (version 0.0.4)
     */
    virtual std::string toPrometheusFormat() const = 0;

    /**
     * @brief Текущее значение счётчика (0, если ключа ещё нет)
     */
    virtual int64_t value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const = 0;
};

} // namespace escrow::ports::input
