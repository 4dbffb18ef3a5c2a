#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/IEscrowService.hpp"
#include "utils/JsonMapper.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace escrow::adapters::primary
{

    /**
     * @brief Операции над аллокацией
     *
     * - POST /api/v1/allocations/{id}/eligible
     * - POST /api/v1/allocations/{id}/release
     * - POST /api/v1/allocations/{id}/refund
     *
     * Тело release/refund (все поля необязательны):
     * {"amount": "12.30", "currency": "USD", "reference": "po-1", "initiated_by": "ops"}
     * Без amount расходуется весь остаток доли. Без currency сумма
     * трактуется в валюте escrow.
     */
    class AllocationCommandHandler : public IHttpHandler
    {
    public:
        explicit AllocationCommandHandler(std::shared_ptr<ports::input::IEscrowService> escrowService)
            : escrowService_(std::move(escrowService))
        {
            std::cout << "[AllocationCommandHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto segments = pathSegments(req.getPath(), "/api/v1/allocations");
                if (segments.size() != 2)
                {
                    sendError(res, 404, "Unknown allocation resource");
                    return;
                }

                const std::string &allocationId = segments[0];
                const std::string &action = segments[1];

                if (action == "eligible")
                {
                    auto allocation = escrowService_->onShipmentDelivered(allocationId);
                    res.setResult(200, "application/json", utils::JsonMapper::toJson(allocation).dump());
                }
                else if (action == "release" || action == "refund")
                {
                    handleDrawDown(req, res, allocationId, action == "release");
                }
                else
                {
                    sendError(res, 404, "Unknown allocation action: " + action);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, std::string("Invalid JSON: ") + e.what());
            }
            catch (const domain::EscrowException &e)
            {
                sendEscrowError(res, "AllocationCommandHandler", e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[AllocationCommandHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IEscrowService> escrowService_;

        void handleDrawDown(IRequest &req, IResponse &res, const std::string &allocationId, bool release)
        {
            nlohmann::json body = req.getBody().empty()
                ? nlohmann::json::object()
                : nlohmann::json::parse(req.getBody());

            if (!body.is_object())
            {
                sendError(res, 400, "Request body must be a JSON object");
                return;
            }

            std::optional<domain::Money> amount;
            if (body.contains("amount") && !body["amount"].is_null())
            {
                amount = utils::JsonMapper::parseMoney(body["amount"], currencyOf(allocationId, body));
            }

            auto reference = utils::JsonMapper::optionalString(body, "reference");
            auto initiatedBy = utils::JsonMapper::optionalString(body, "initiated_by");

            auto result = release
                ? escrowService_->requestRelease(allocationId, amount, reference, initiatedBy)
                : escrowService_->requestRefund(allocationId, amount, reference, initiatedBy);

            res.setResult(200, "application/json", utils::JsonMapper::toJson(result).dump());
        }

        std::string currencyOf(const std::string &allocationId, const nlohmann::json &body)
        {
            if (body.contains("currency") && body["currency"].is_string())
            {
                return body["currency"].get<std::string>();
            }
            auto payment = escrowService_->getEscrowByAllocationId(allocationId);
            if (!payment)
            {
                throw domain::NotFoundException("Allocation " + allocationId + " not found.");
            }
            return payment->currency();
        }
    };

} // namespace escrow::adapters::primary
