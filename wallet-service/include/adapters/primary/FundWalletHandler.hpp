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
     * @brief POST /api/v1/wallet/fund: пополнить кошелёк
     *
     * Тело: {"amount": 1000.5, "currency": "NGN", "reference": "PAYSTACK_REF_123"}
     * Ответ 201: проведённая запись журнала.
     */
    class FundWalletHandler : public IHttpHandler
    {
    public:
        explicit FundWalletHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[FundWalletHandler] Created" << std::endl;
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

                auto amount = parseAmount(body);
                auto currency = parseCurrencyField(body, "currency");
                std::string reference = body.value("reference", "");

                auto entry = ledgerService_->fund(*ownerId, amount, currency, reference);

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
                std::cerr << "[FundWalletHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace wallet::adapters::primary
