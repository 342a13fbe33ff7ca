#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Поддерживаемые валюты (закрытый каталог)
 *
 * Всё, что вне каталога, отклоняется на границе сервиса.
 */
enum class Currency {
    NGN,    ///< Нигерийская найра (валюта по умолчанию)
    USD,    ///< Доллар США
    EUR,    ///< Евро
    GBP     ///< Фунт стерлингов
};

/**
 * @brief Преобразовать в ISO-код
 */
inline std::string toString(Currency currency) {
    switch (currency) {
        case Currency::NGN: return "NGN";
        case Currency::USD: return "USD";
        case Currency::EUR: return "EUR";
        case Currency::GBP: return "GBP";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из ISO-кода
 * @throws std::invalid_argument если валюта не входит в каталог
 */
inline Currency currencyFromString(const std::string& code) {
    if (code == "NGN") return Currency::NGN;
    if (code == "USD") return Currency::USD;
    if (code == "EUR") return Currency::EUR;
    if (code == "GBP") return Currency::GBP;
    throw std::invalid_argument("Unsupported currency: " + code);
}

inline bool isSupportedCurrency(const std::string& code) {
    return code == "NGN" || code == "USD" || code == "EUR" || code == "GBP";
}

/**
 * @brief Все валюты каталога в порядке ISO-кодов
 */
inline const std::vector<Currency>& allCurrencies() {
    static const std::vector<Currency> currencies = {
        Currency::EUR, Currency::GBP, Currency::NGN, Currency::USD
    };
    return currencies;
}

} // namespace wallet::domain
