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
     * @brief История операций владельца
     *
     * GET /api/v1/wallet/transactions?page=1&limit=10 -> постранично, новые первыми
     * GET /api/v1/wallet/transactions/type/{TYPE}     -> все записи одного вида
     *
     * Роутер регистрирует оба пути на один обработчик; вид берётся из
     * path-параметра, если он есть.
     */
    class GetTransactionsHandler : public IHttpHandler
    {
    public:
        explicit GetTransactionsHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[GetTransactionsHandler] Created" << std::endl;
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
                auto kindParam = req.getPathParam(0);
                if (kindParam && !kindParam->empty())
                {
                    handleByKind(*ownerId, *kindParam, res);
                    return;
                }

                size_t page = parseSize(req.getQueryParam("page").value_or(""), 1);
                size_t limit = parseSize(req.getQueryParam("limit").value_or(""), 10);

                auto result = ledgerService_->getTransactions(*ownerId, page, limit);

                nlohmann::json response;
                response["data"] = nlohmann::json::array();
                for (const auto &entry : result.entries)
                {
                    response["data"].push_back(toJson(entry));
                }
                response["meta"]["total"] = result.total;
                response["meta"]["page"] = result.page;
                response["meta"]["limit"] = result.limit;
                response["meta"]["total_pages"] = result.totalPages;

                res.setResult(200, "application/json", response.dump());
            }
            catch (const domain::LedgerException &e)
            {
                sendLedgerError(res, e);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetTransactionsHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;

        void handleByKind(const std::string &ownerId, const std::string &kindName, IResponse &res)
        {
            domain::LedgerEntryKind kind;
            try
            {
                kind = domain::ledgerEntryKindFromString(kindName);
            }
            catch (const std::invalid_argument &)
            {
                sendError(res, 400, "Unknown transaction type: " + kindName);
                return;
            }

            auto entries = ledgerService_->getTransactionsByKind(ownerId, kind);

            nlohmann::json response = nlohmann::json::array();
            for (const auto &entry : entries)
            {
                response.push_back(toJson(entry));
            }
            res.setResult(200, "application/json", response.dump());
        }

        static size_t parseSize(const std::string &text, size_t defaultValue)
        {
            if (text.empty())
            {
                return defaultValue;
            }
            try
            {
                long long value = std::stoll(text);
                return value > 0 ? static_cast<size_t>(value) : defaultValue;
            }
            catch (const std::exception &)
            {
                return defaultValue;
            }
        }
    };

} // namespace wallet::adapters::primary
