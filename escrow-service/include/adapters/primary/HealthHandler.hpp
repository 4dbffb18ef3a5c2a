#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "adapters/primary/HttpErrors.hpp"
#include "settings/IEscrowSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace escrow::adapters::primary {

/**
 * @brief GET /health: живость процесса и режим хранилища
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<settings::IEscrowSettings> settings)
        : settings_(std::move(settings))
    {
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "escrow-service";
        response["version"] = "1.0.0";
        response["storage"] = settings_->getStorage();
        response["lock_timeout_ms"] = settings_->getLockTimeout().count();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<settings::IEscrowSettings> settings_;
};

} // namespace escrow::adapters::primary
