#pragma once

#include <chrono>
#include <string>

namespace wallet::settings {

class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    /// Максимальное ожидание захвата балансов
    virtual std::chrono::milliseconds getHoldTimeout() const = 0;

    /// Допустимое отклонение живого курса от резервного, %; 0 отключает проверку
    virtual double getMaxRateDeviationPercent() const = 0;

    /// "postgres" или "memory"
    virtual std::string getStoreType() const = 0;
};

} // namespace wallet::settings
