#pragma once

#include <IRequest.hpp>
#include "domain/Balance.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/LedgerError.hpp"
#include "domain/ConversionQuote.hpp"
#include "domain/RateTable.hpp"
#include "domain/enums/Currency.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace wallet::adapters::primary
{

    /**
     * @brief Идентификатор владельца из заголовка X-User-Id
     *
     * Заголовок проставляет API-шлюз после аутентификации.
     */
    inline std::optional<std::string> extractOwnerId(IRequest &req)
    {
        auto ownerId = req.getHeader("X-User-Id");
        if (!ownerId || ownerId->empty())
        {
            return std::nullopt;
        }
        return ownerId;
    }

    /**
     * @brief Разобрать сумму: число или строка "100.50"
     * @throws LedgerException(InvalidAmount) если поле отсутствует или не число
     */
    inline domain::Decimal parseAmount(const nlohmann::json &body, const std::string &field = "amount")
    {
        if (!body.contains(field) || body[field].is_null())
        {
            throw domain::LedgerException(domain::LedgerErrorCode::InvalidAmount, "Amount is required");
        }

        const auto &value = body[field];
        try
        {
            if (value.is_number_integer())
            {
                return domain::Decimal::fromUnits(value.get<int64_t>());
            }
            if (value.is_number())
            {
                return domain::Decimal::fromDouble(value.get<double>());
            }
            if (value.is_string())
            {
                return domain::Decimal::fromString(value.get<std::string>());
            }
        }
        catch (const std::exception &e)
        {
            throw domain::LedgerException(domain::LedgerErrorCode::InvalidAmount,
                                          std::string("Invalid amount: ") + e.what());
        }
        throw domain::LedgerException(domain::LedgerErrorCode::InvalidAmount, "Amount must be a number");
    }

    /**
     * @brief Разобрать ISO-код валюты из каталога
     * @throws LedgerException(UnsupportedCurrency)
     */
    inline domain::Currency parseCurrency(const std::string &code)
    {
        if (!domain::isSupportedCurrency(code))
        {
            throw domain::LedgerException(domain::LedgerErrorCode::UnsupportedCurrency,
                                          "Unsupported currency: " + code);
        }
        return domain::currencyFromString(code);
    }

    inline domain::Currency parseCurrencyField(const nlohmann::json &body, const std::string &field)
    {
        if (!body.contains(field) || !body[field].is_string())
        {
            throw domain::LedgerException(domain::LedgerErrorCode::UnsupportedCurrency,
                                          field + " is required");
        }
        return parseCurrency(body[field].get<std::string>());
    }

    inline nlohmann::json toJson(const domain::Balance &balance)
    {
        nlohmann::json j;
        j["currency"] = domain::toString(balance.currency);
        j["total"] = balance.total.toDouble();
        j["locked"] = balance.locked.toDouble();
        j["available"] = balance.available.toDouble();
        j["updated_at"] = balance.updatedAt.toString();
        return j;
    }

    inline nlohmann::json toJson(const domain::LedgerEntry &entry)
    {
        nlohmann::json j;
        j["id"] = entry.id;
        j["owner_id"] = entry.ownerId;
        j["type"] = domain::toString(entry.kind);
        j["status"] = domain::toString(entry.status);
        j["from_currency"] = domain::toString(entry.fromCurrency);
        j["to_currency"] = domain::toString(entry.toCurrency);
        j["amount"] = entry.amount.toDouble();
        j["rate"] = entry.rate.toDouble();
        j["converted_amount"] = entry.convertedAmount.toDouble();
        j["description"] = entry.description;
        j["created_at"] = entry.createdAt.toString();
        if (entry.counterpartyId)
        {
            j["to_user_id"] = *entry.counterpartyId;
        }
        if (entry.reference)
        {
            j["reference"] = *entry.reference;
        }
        return j;
    }

    inline nlohmann::json toJson(const domain::ConversionQuote &quote)
    {
        nlohmann::json j;
        j["from_currency"] = domain::toString(quote.fromCurrency);
        j["to_currency"] = domain::toString(quote.toCurrency);
        j["amount"] = quote.amount.toDouble();
        j["rate"] = quote.rate.toDouble();
        j["converted_amount"] = quote.convertedAmount.toDouble();
        return j;
    }

    inline nlohmann::json toJson(const domain::RateTable &table)
    {
        nlohmann::json j;
        j["base"] = table.base;
        j["rates"] = table.rates;
        j["timestamp"] = table.timestamp.toString();
        return j;
    }

} // namespace wallet::adapters::primary
