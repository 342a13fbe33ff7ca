#pragma once

#include "ports/output/IEligibilityChecker.hpp"
#include "settings/AuthClientSettings.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <optional>

namespace wallet::adapters::secondary {

/**
 * @brief Проверка владельца через Auth Service
 *
 * Вызывает GET /api/v1/users/{id}; владелец допускается к операциям,
 * если пользователь найден и email подтверждён (is_email_verified).
 * Для получателя перевода достаточно, чтобы пользователь был найден.
 * Любая ошибка связи трактуется как "не допущен".
 */
class HttpEligibilityChecker : public ports::output::IEligibilityChecker {
public:
    HttpEligibilityChecker(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::AuthClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpEligibilityChecker] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort() << std::endl;
    }

    bool isEligible(const std::string& ownerId) override {
        auto user = fetchUser(ownerId);
        if (!user) {
            return false;
        }
        auto verified = user->find("is_email_verified");
        return verified != user->end() && verified->is_boolean() && verified->get<bool>();
    }

    bool exists(const std::string& ownerId) override {
        return fetchUser(ownerId).has_value();
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::AuthClientSettings> settings_;

    /**
     * @brief Профиль пользователя или nullopt (не найден, ошибка связи, неверное тело)
     */
    std::optional<nlohmann::json> fetchUser(const std::string& ownerId) {
        try {
            SimpleRequest request(
                "GET",
                "/api/v1/users/" + ownerId,
                "",
                settings_->getHost(),
                settings_->getPort(),
                {}
            );

            SimpleResponse response;
            if (!httpClient_->send(request, response)) {
                std::cerr << "[HttpEligibilityChecker] Auth service unreachable" << std::endl;
                return std::nullopt;
            }

            if (response.getStatus() != 200) {
                return std::nullopt;
            }

            auto body = nlohmann::json::parse(response.getBody());
            if (!body.is_object()) {
                return std::nullopt;
            }
            return body;

        } catch (const std::exception& e) {
            std::cerr << "[HttpEligibilityChecker] Error: " << e.what() << std::endl;
            return std::nullopt;
        }
    }
};

} // namespace wallet::adapters::secondary
