#pragma once

#include "ports/input/IMetricsService.hpp"
#include "settings/IMetricsSettings.hpp"

#include <memory>
#include <string>
#include <sstream>
#include <map>
#include <unordered_map>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <iostream>

namespace escrow::application {

/**
 * @brief Счётчики escrow-сервиса в формате Prometheus
 *
 * Все ключи из IMetricsSettings создаются нулевыми при старте, поэтому
 * /metrics сразу показывает полный набор. Инкремент существующего ключа
 * идёт под shared_lock, новый ключ добавляется под unique_lock.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    explicit MetricsService(std::shared_ptr<settings::IMetricsSettings> settings)
        : settings_(std::move(settings))
    {
        for (const auto& key : settings_->getAllKeys()) {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(0);
        }

        std::cout << "[MetricsService] Initialized with "
                  << counters_.size() << " metrics" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(1, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& counter = counters_[key];
        if (!counter) {
            counter = std::make_unique<std::atomic<int64_t>>(0);
        }
        counter->fetch_add(1, std::memory_order_relaxed);
    }

    /**
     * @brief HELP/TYPE по описаниям, затем все счётчики в порядке ключей
     *
     * Счётчики с labels, появившиеся в работе (http_requests_total{...}),
     * тоже попадают в вывод.
     */
    std::string toPrometheusFormat() const override {
        std::ostringstream oss;

        for (const auto& def : settings_->getDefinitions()) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";
        }

        std::map<std::string, int64_t> snapshot;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            for (const auto& [key, counter] : counters_) {
                snapshot.emplace(key, counter->load(std::memory_order_relaxed));
            }
        }

        for (const auto& [key, count] : snapshot) {
            oss << key << " " << count << "\n";
        }
        return oss.str();
    }

    int64_t value(const std::string& name, const std::map<std::string, std::string>& labels = {}) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(buildKey(name, labels));
        return it != counters_.end() ? it->second->load(std::memory_order_relaxed) : 0;
    }

private:
    std::shared_ptr<settings::IMetricsSettings> settings_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) {
        if (labels.empty()) {
            return name;
        }

        std::ostringstream oss;
        oss << name << "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) oss << ",";
            oss << k << "=\"" << escapeLabel(v) << "\"";
            first = false;
        }
        oss << "}";
        return oss.str();
    }

    static std::string escapeLabel(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (char c : value) {
            if (c == '\\' || c == '"') {
                out += '\\';
                out += c;
            } else if (c == '\n') {
                out += "\\n";
            } else {
                out += c;
            }
        }
        return out;
    }
};

} // namespace escrow::application
