#pragma once

#include <string>

namespace wallet::settings {

class IRateProviderSettings {
public:
    virtual ~IRateProviderSettings() = default;

    virtual std::string getHost() const = 0;
    virtual int getPort() const = 0;
    virtual std::string getApiKey() const = 0;
};

} // namespace wallet::settings
