#pragma once

#include <string>
#include <vector>

namespace wallet::settings {

/**
 * @brief Адрес и ключ одного источника курсов
 */
struct RateSourceEndpoint {
    std::string host;
    int port = 80;
    std::string apiKey;
};

class IRateSourceSettings {
public:
    virtual ~IRateSourceSettings() = default;

    virtual RateSourceEndpoint getExchangeRatesApi() const = 0;
    virtual RateSourceEndpoint getFixerApi() const = 0;

    /**
     * @brief Имена источников в порядке приоритета
     */
    virtual std::vector<std::string> getPriority() const = 0;
};

} // namespace wallet::settings
