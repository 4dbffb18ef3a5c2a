#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/ISettlementService.hpp"
#include "utils/JsonMapper.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace escrow::adapters::primary
{

    /**
     * @brief Расчётные ведомости
     *
     * - POST /api/v1/settlements/close            {store_id, year, month}
     * - GET  /api/v1/settlements?store_id=...    : все ведомости магазина
     * - GET  /api/v1/settlements/{id}
     * - POST /api/v1/settlements/{id}/adjustments {original_year, original_month, amount, reason,
     *                                              related_order_id?, related_order_number?}
     * - POST /api/v1/settlements/{id}/approve     {approved_by}
     * - POST /api/v1/settlements/{id}/export
     * - POST /api/v1/settlements/{id}/notes       {notes}
     */
    class SettlementHandler : public IHttpHandler
    {
    public:
        explicit SettlementHandler(std::shared_ptr<ports::input::ISettlementService> settlementService)
            : settlementService_(std::move(settlementService))
        {
            std::cout << "[SettlementHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string method = req.getMethod();

            try
            {
                auto segments = pathSegments(req.getPath(), "/api/v1/settlements");

                if (method == "GET")
                {
                    handleGet(req, res, segments);
                }
                else if (method == "POST")
                {
                    handlePost(req, res, segments);
                }
                else
                {
                    sendError(res, 405, "Method not allowed");
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, std::string("Invalid JSON: ") + e.what());
            }
            catch (const domain::EscrowException &e)
            {
                sendEscrowError(res, "SettlementHandler", e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SettlementHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ISettlementService> settlementService_;

        void handleGet(IRequest &req, IResponse &res, const std::vector<std::string> &segments)
        {
            if (segments.empty())
            {
                std::string storeId = req.getQueryParam("store_id").value_or("");
                if (storeId.empty())
                {
                    sendError(res, 400, "Parameter 'store_id' is required");
                    return;
                }

                nlohmann::json response;
                response["store_id"] = storeId;
                response["settlements"] = nlohmann::json::array();
                for (const auto &settlement : settlementService_->listSettlements(storeId))
                {
                    response["settlements"].push_back(utils::JsonMapper::toJson(settlement));
                }
                res.setResult(200, "application/json", response.dump());
                return;
            }

            if (segments.size() != 1)
            {
                sendError(res, 404, "Unknown settlement resource");
                return;
            }

            auto settlement = settlementService_->getSettlement(segments[0]);
            if (!settlement)
            {
                sendError(res, 404, "Settlement not found");
                return;
            }
            res.setResult(200, "application/json", utils::JsonMapper::toJson(*settlement).dump());
        }

        void handlePost(IRequest &req, IResponse &res, const std::vector<std::string> &segments)
        {
            nlohmann::json body = req.getBody().empty()
                ? nlohmann::json::object()
                : nlohmann::json::parse(req.getBody());

            if (!body.is_object())
            {
                sendError(res, 400, "Request body must be a JSON object");
                return;
            }

            if (segments.size() == 1 && segments[0] == "close")
            {
                std::string storeId = body.value("store_id", "");
                if (storeId.empty() || !body.contains("year") || !body.contains("month"))
                {
                    sendError(res, 400, "Fields 'store_id', 'year' and 'month' are required");
                    return;
                }

                auto settlement = settlementService_->closeSettlementPeriod(
                    storeId, body["year"].get<int>(), body["month"].get<int>());
                sendSettlement(res, settlement);
                return;
            }

            if (segments.size() != 2)
            {
                sendError(res, 404, "Unknown settlement resource");
                return;
            }

            const std::string &settlementId = segments[0];
            const std::string &action = segments[1];

            if (action == "adjustments")
            {
                handleAdjustment(res, settlementId, body);
            }
            else if (action == "approve")
            {
                std::string approvedBy = body.value("approved_by", "");
                sendSettlement(res, settlementService_->approveSettlement(settlementId, approvedBy));
            }
            else if (action == "export")
            {
                sendSettlement(res, settlementService_->markExported(settlementId));
            }
            else if (action == "notes")
            {
                sendSettlement(res, settlementService_->updateNotes(settlementId, body.value("notes", "")));
            }
            else
            {
                sendError(res, 404, "Unknown settlement action: " + action);
            }
        }

        void handleAdjustment(IResponse &res, const std::string &settlementId, const nlohmann::json &body)
        {
            if (!body.contains("original_year") || !body.contains("original_month") || !body.contains("amount"))
            {
                sendError(res, 400, "Fields 'original_year', 'original_month' and 'amount' are required");
                return;
            }

            auto settlement = settlementService_->getSettlement(settlementId);
            if (!settlement)
            {
                sendError(res, 404, "Settlement not found");
                return;
            }

            std::string currency = body.value("currency", settlement->currency());
            auto amount = utils::JsonMapper::parseMoney(body["amount"], currency);

            auto updated = settlementService_->recordAdjustment(
                settlementId,
                body["original_year"].get<int>(),
                body["original_month"].get<int>(),
                amount,
                body.value("reason", ""),
                utils::JsonMapper::optionalString(body, "related_order_id"),
                utils::JsonMapper::optionalString(body, "related_order_number"));

            sendSettlement(res, updated);
        }

        static void sendSettlement(IResponse &res, const domain::Settlement &settlement)
        {
            res.setResult(200, "application/json", utils::JsonMapper::toJson(settlement).dump());
        }
    };

} // namespace escrow::adapters::primary
