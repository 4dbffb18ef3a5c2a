#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/IEscrowService.hpp"
#include "utils/JsonMapper.hpp"
#include <memory>
#include <iostream>

namespace escrow::adapters::primary
{

    /**
     * @brief GET /api/v1/stores/{storeId}/escrow-balance
     */
    class SellerBalanceHandler : public IHttpHandler
    {
    public:
        explicit SellerBalanceHandler(std::shared_ptr<ports::input::IEscrowService> escrowService)
            : escrowService_(std::move(escrowService))
        {
            std::cout << "[SellerBalanceHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto segments = pathSegments(req.getPath(), "/api/v1/stores");
                if (segments.size() != 2 || segments[1] != "escrow-balance")
                {
                    sendError(res, 404, "Unknown store resource");
                    return;
                }

                auto balance = escrowService_->getSellerBalance(segments[0]);
                res.setResult(200, "application/json", utils::JsonMapper::toJson(balance).dump());
            }
            catch (const domain::EscrowException &e)
            {
                sendEscrowError(res, "SellerBalanceHandler", e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SellerBalanceHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IEscrowService> escrowService_;
    };

} // namespace escrow::adapters::primary
