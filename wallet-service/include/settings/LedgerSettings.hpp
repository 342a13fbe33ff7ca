#pragma once

#include "ILedgerSettings.hpp"
#include <cstdlib>
#include <string>

namespace wallet::settings {

/**
 * @brief Настройки движка операций
 *
 * Читает из ENV:
 * - LEDGER_HOLD_TIMEOUT_MS (default: 5000)
 * - LEDGER_MAX_RATE_DEVIATION_PERCENT (default: 0, проверка выключена)
 * - LEDGER_STORE (default: "postgres")
 */
class LedgerSettings : public ILedgerSettings {
public:
    LedgerSettings() {
        if (const char* val = std::getenv("LEDGER_HOLD_TIMEOUT_MS")) {
            holdTimeoutMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("LEDGER_MAX_RATE_DEVIATION_PERCENT")) {
            maxRateDeviationPercent_ = std::stod(val);
        }
        if (const char* val = std::getenv("LEDGER_STORE")) {
            storeType_ = val;
        }
    }

    std::chrono::milliseconds getHoldTimeout() const override {
        return std::chrono::milliseconds(holdTimeoutMs_);
    }
    double getMaxRateDeviationPercent() const override { return maxRateDeviationPercent_; }
    std::string getStoreType() const override { return storeType_; }

private:
    int holdTimeoutMs_ = 5000;
    double maxRateDeviationPercent_ = 0.0;
    std::string storeType_ = "postgres";
};

} // namespace wallet::settings
