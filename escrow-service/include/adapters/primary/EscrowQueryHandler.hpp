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
     * @brief Чтение escrow-платежей и отмена заказа
     *
     * - GET /api/v1/escrows?order_id=...    : escrow по заказу
     * - GET /api/v1/escrows/{id}            : escrow с аллокациями
     * - GET /api/v1/escrows/{id}/ledger     : журнал по (created_at, sequence)
     * - GET /api/v1/escrows/{id}/balance    : остаток
     * - GET /api/v1/escrows/{id}/reconcile  : сверка журнала с состоянием
     * - POST /api/v1/escrows/{id}/refund    : вернуть покупателю всё, что осталось
     *
     * Тело refund (необязательно): {"reference": "rf-1", "initiated_by": "support"}
     */
    class EscrowQueryHandler : public IHttpHandler
    {
    public:
        explicit EscrowQueryHandler(std::shared_ptr<ports::input::IEscrowService> escrowService)
            : escrowService_(std::move(escrowService))
        {
            std::cout << "[EscrowQueryHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            try
            {
                auto segments = pathSegments(req.getPath(), "/api/v1/escrows");

                if (req.getMethod() == "POST" && segments.size() == 2 && segments[1] == "refund")
                {
                    handleRefund(req, res, segments[0]);
                    return;
                }
                if (req.getMethod() != "GET")
                {
                    sendError(res, 405, "Method not allowed");
                    return;
                }

                if (segments.empty())
                {
                    handleByOrder(req, res);
                    return;
                }

                const std::string &escrowId = segments[0];
                if (segments.size() == 1)
                {
                    auto payment = escrowService_->getEscrowPayment(escrowId);
                    if (!payment)
                    {
                        sendError(res, 404, "Escrow not found");
                        return;
                    }
                    res.setResult(200, "application/json", utils::JsonMapper::toJson(*payment).dump());
                }
                else if (segments.size() == 2 && segments[1] == "ledger")
                {
                    handleLedger(res, escrowId);
                }
                else if (segments.size() == 2 && segments[1] == "balance")
                {
                    auto balance = escrowService_->getRemainingBalance(escrowId);

                    nlohmann::json response;
                    response["escrow_payment_id"] = escrowId;
                    response["remaining_balance"] = balance.toString();
                    response["currency"] = balance.currency();
                    res.setResult(200, "application/json", response.dump());
                }
                else if (segments.size() == 2 && segments[1] == "reconcile")
                {
                    auto result = escrowService_->reconcile(escrowId);
                    res.setResult(200, "application/json", utils::JsonMapper::toJson(result).dump());
                }
                else
                {
                    sendError(res, 404, "Unknown escrow resource");
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, std::string("Invalid JSON: ") + e.what());
            }
            catch (const domain::EscrowException &e)
            {
                sendEscrowError(res, "EscrowQueryHandler", e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[EscrowQueryHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IEscrowService> escrowService_;

        void handleByOrder(IRequest &req, IResponse &res)
        {
            std::string orderId = req.getQueryParam("order_id").value_or("");
            if (orderId.empty())
            {
                sendError(res, 400, "Parameter 'order_id' is required");
                return;
            }

            auto payment = escrowService_->getEscrowByOrderId(orderId);
            if (!payment)
            {
                sendError(res, 404, "Escrow not found for order " + orderId);
                return;
            }
            res.setResult(200, "application/json", utils::JsonMapper::toJson(*payment).dump());
        }

        void handleRefund(IRequest &req, IResponse &res, const std::string &escrowId)
        {
            nlohmann::json body = req.getBody().empty()
                ? nlohmann::json::object()
                : nlohmann::json::parse(req.getBody());

            if (!body.is_object())
            {
                sendError(res, 400, "Request body must be a JSON object");
                return;
            }

            auto payment = escrowService_->getEscrowPayment(escrowId);
            if (!payment)
            {
                sendError(res, 404, "Escrow not found");
                return;
            }

            auto results = escrowService_->refundOrder(
                payment->orderId(),
                utils::JsonMapper::optionalString(body, "reference"),
                utils::JsonMapper::optionalString(body, "initiated_by"));

            nlohmann::json response;
            response["escrow_payment_id"] = escrowId;
            response["order_id"] = payment->orderId();
            response["refunds"] = nlohmann::json::array();
            for (const auto &result : results)
            {
                response["refunds"].push_back(utils::JsonMapper::toJson(result));
            }
            response["count"] = results.size();
            res.setResult(200, "application/json", response.dump());
        }

        void handleLedger(IResponse &res, const std::string &escrowId)
        {
            auto entries = escrowService_->getLedger(escrowId);

            nlohmann::json response;
            response["escrow_payment_id"] = escrowId;
            response["entries"] = nlohmann::json::array();
            for (const auto &entry : entries)
            {
                response["entries"].push_back(utils::JsonMapper::toJson(entry));
            }
            response["count"] = entries.size();
            res.setResult(200, "application/json", response.dump());
        }
    };

} // namespace escrow::adapters::primary
