#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ILedgerService.hpp"
#include "LedgerErrorMapper.hpp"
#include "WalletJson.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace wallet::adapters::primary
{

    /**
     * @brief POST /api/v1/wallet/transfer: перевод другому пользователю
     *
     * Тело: {"to_user_id": "...", "amount": 50, "currency": "USD", "description": "..."}
     * description необязателен.
     */
    class TransferFundsHandler : public IHttpHandler
    {
    public:
        explicit TransferFundsHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[TransferFundsHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            auto ownerId = extractOwnerId(req);
            if (!ownerId)
            {
                sendError(res, 401, "X-User-Id header required");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());

                std::string toUserId = body.value("to_user_id", "");
                if (toUserId.empty())
                {
                    sendError(res, 400, "to_user_id is required");
                    return;
                }

                auto amount = parseAmount(body);
                auto currency = parseCurrencyField(body, "currency");
                std::string description = body.value("description", "");

                auto entry = ledgerService_->transfer(*ownerId, toUserId, amount, currency, description);

                res.setResult(201, "application/json", toJson(entry).dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const domain::LedgerException &e)
            {
                sendLedgerError(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[TransferFundsHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace wallet::adapters::primary
