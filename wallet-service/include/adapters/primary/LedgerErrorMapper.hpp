#pragma once

#include <IResponse.hpp>
#include "domain/LedgerError.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace wallet::adapters::primary
{

    /**
     * @brief HTTP-статус для кода ошибки журнала
     *
     * валидация → 400, владелец не допущен → 403, нехватка средств → 422,
     * временная недоступность зависимостей → 503, прочее → 500.
     */
    inline int httpStatusFor(domain::LedgerErrorCode code)
    {
        switch (code)
        {
        case domain::LedgerErrorCode::InvalidAmount:
        case domain::LedgerErrorCode::SameOwner:
        case domain::LedgerErrorCode::SameCurrency:
        case domain::LedgerErrorCode::UnsupportedCurrency:
            return 400;
        case domain::LedgerErrorCode::OwnerNotEligible:
            return 403;
        case domain::LedgerErrorCode::InsufficientFunds:
            return 422;
        case domain::LedgerErrorCode::RateUnavailable:
        case domain::LedgerErrorCode::HoldTimeout:
        case domain::LedgerErrorCode::StorageUnavailable:
            return 503;
        case domain::LedgerErrorCode::Internal:
            return 500;
        }
        return 500;
    }

    inline void sendError(IResponse &res, int status, const std::string &message)
    {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }

    /**
     * @brief Ответ {"error": "...", "code": "INSUFFICIENT_FUNDS"}
     */
    inline void sendLedgerError(IResponse &res, const domain::LedgerException &e)
    {
        nlohmann::json error;
        error["error"] = e.what();
        error["code"] = domain::toString(e.code());
        res.setResult(httpStatusFor(e.code()), "application/json", error.dump());
    }

} // namespace wallet::adapters::primary
