#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <iostream>

namespace escrow::adapters::primary {

/**
 * @brief GET /metrics в текстовом формате Prometheus 0.0.4
 *
 * @example Response:
 * ```
 * # HELP escrow_releases_total Total release operations
 * # TYPE escrow_releases_total counter
 * escrow_releases_total 17
 * ```
 */
class MetricsHandler : public IHttpHandler {
public:
    explicit MetricsHandler(std::shared_ptr<ports::input::IMetricsService> metrics)
        : metrics_(std::move(metrics))
    {
        std::cout << "[MetricsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        std::string body = metrics_->toPrometheusFormat();
        res.setStatus(200);
        res.setHeader("Content-Type", kContentType);
        res.setBody(body);
    }

private:
    static constexpr const char* kContentType = "text/plain; version=0.0.4; charset=utf-8";

    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace escrow::adapters::primary
