#pragma once

namespace wallet::settings {

class IFallbackRateSettings {
public:
    virtual ~IFallbackRateSettings() = default;

    /// Возраст точки (сек), после которого она считается устаревшей
    virtual int getMaxAgeSeconds() const = 0;

    /// Порог (%) изменения курса, о котором пишется предупреждение
    virtual double getChangeAlertPercent() const = 0;

    /// Интервал фонового обновления (сек)
    virtual int getRefreshIntervalSeconds() const = 0;
};

} // namespace wallet::settings
