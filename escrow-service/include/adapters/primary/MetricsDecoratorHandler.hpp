// escrow-service/include/adapters/primary/MetricsDecoratorHandler.hpp
#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <string>
#include <initializer_list>
#include <iostream>

namespace escrow::adapters::primary
{

    /**
     * @brief Декоратор: считает запросы в http_requests_total{method, path}
     *
     * Path сводится к ресурсу, чтобы ID не раздували число серий:
     * - /api/v1/escrows/esc-1/ledger -> /api/v1/escrows
     * - /api/v1/allocations/alloc-1/release -> /api/v1/allocations
     * - /api/v1/settlements/stl-1/approve -> /api/v1/settlements
     */
    class MetricsDecoratorHandler : public IHttpHandler
    {
    public:
        MetricsDecoratorHandler(
            std::shared_ptr<IHttpHandler> inner,
            std::shared_ptr<ports::input::IMetricsService> metrics) : inner_(std::move(inner)), metrics_(std::move(metrics))
        {
        }

        void handle(IRequest &req, IResponse &res) override
        {
            metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                        {"path", normalizePath(req.getPath())}});

            inner_->handle(req, res);
        }

        static std::string normalizePath(const std::string &path)
        {
            std::string cleanPath = path.substr(0, path.find('?'));

            for (const char *resource : {"/api/v1/escrows", "/api/v1/allocations",
                                         "/api/v1/stores", "/api/v1/settlements"})
            {
                std::string base(resource);
                if (cleanPath == base || cleanPath.compare(0, base.size() + 1, base + "/") == 0)
                {
                    return base;
                }
            }

            return cleanPath;
        }

    private:
        std::shared_ptr<IHttpHandler> inner_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;
    };

} // namespace escrow::adapters::primary
