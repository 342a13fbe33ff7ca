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
     * @brief POST /api/v1/wallet/trade: обмен валюты по живому курсу
     *
     * Тело: {"from_currency": "NGN", "to_currency": "USD", "amount": 10000}
     */
    class TradeCurrencyHandler : public IHttpHandler
    {
    public:
        explicit TradeCurrencyHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[TradeCurrencyHandler] Created" << std::endl;
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

                auto fromCurrency = parseCurrencyField(body, "from_currency");
                auto toCurrency = parseCurrencyField(body, "to_currency");
                auto amount = parseAmount(body);

                auto entry = ledgerService_->trade(*ownerId, fromCurrency, toCurrency, amount);

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
                std::cerr << "[TradeCurrencyHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace wallet::adapters::primary
