#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IRateService.hpp"
#include "LedgerErrorMapper.hpp"
#include "WalletJson.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace wallet::adapters::primary
{

    /**
     * @brief POST /api/v1/fx/convert: котировка без изменения балансов
     *
     * Тело: {"from_currency": "NGN", "to_currency": "USD", "amount": 1000}
     */
    class ConvertCurrencyHandler : public IHttpHandler
    {
    public:
        explicit ConvertCurrencyHandler(std::shared_ptr<ports::input::IRateService> rateService)
            : rateService_(std::move(rateService))
        {
            std::cout << "[ConvertCurrencyHandler] Created" << std::endl;
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
                auto body = nlohmann::json::parse(req.getBody());

                auto fromCurrency = parseCurrencyField(body, "from_currency");
                auto toCurrency = parseCurrencyField(body, "to_currency");
                auto amount = parseAmount(body);

                auto quote = rateService_->convert(fromCurrency, toCurrency, amount);

                res.setResult(200, "application/json", toJson(quote).dump());
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
                std::cerr << "[ConvertCurrencyHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IRateService> rateService_;
    };

} // namespace wallet::adapters::primary
