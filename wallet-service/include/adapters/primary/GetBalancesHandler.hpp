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
     * @brief GET /api/v1/wallet/balances: все балансы владельца
     */
    class GetBalancesHandler : public IHttpHandler
    {
    public:
        explicit GetBalancesHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[GetBalancesHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
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
                auto balances = ledgerService_->getBalances(*ownerId);

                nlohmann::json response;
                response["owner_id"] = *ownerId;
                response["balances"] = nlohmann::json::array();
                for (const auto &balance : balances)
                {
                    response["balances"].push_back(toJson(balance));
                }

                res.setResult(200, "application/json", response.dump());
            }
            catch (const domain::LedgerException &e)
            {
                sendLedgerError(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetBalancesHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace wallet::adapters::primary
