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
     * @brief GET /api/v1/fx/rates?base=USD: живая таблица курсов
     *
     * base по умолчанию NGN.
     */
    class GetRatesHandler : public IHttpHandler
    {
    public:
        explicit GetRatesHandler(std::shared_ptr<ports::input::IRateService> rateService)
            : rateService_(std::move(rateService))
        {
            std::cout << "[GetRatesHandler] Created" << std::endl;
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
                std::string base = req.getQueryParam("base").value_or("");
                if (base.empty())
                {
                    base = "NGN";
                }
                parseCurrency(base);

                auto table = rateService_->getRates(base);
                res.setResult(200, "application/json", toJson(table).dump());
            }
            catch (const domain::LedgerException &e)
            {
                sendLedgerError(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetRatesHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IRateService> rateService_;
    };

} // namespace wallet::adapters::primary
