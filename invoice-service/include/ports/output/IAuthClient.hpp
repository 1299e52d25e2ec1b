#pragma once

#include "domain/User.hpp"
#include <string>
#include <optional>

namespace invoicing::ports::output {

/**
 * @brief Результат валидации токена
 */
struct TokenValidationResult {
    bool valid = false;
    std::string message;
    std::string userId;
    std::string role;
};

/**
 * @brief Интерфейс клиента к Auth Service
 *
 * Используется для валидации токенов и определения роли сотрудника.
 */
class IAuthClient {
public:
    virtual ~IAuthClient() = default;

    /**
     * @brief Валидировать access token
     * @param token Access token
     * @return Результат валидации с user_id и role
     */
    virtual TokenValidationResult validateAccessToken(const std::string& token) = 0;

    /**
     * @brief Определить инициатора запроса по токену
     * @return Actor или nullopt если токен невалидный
     */
    virtual std::optional<domain::Actor> resolveActor(const std::string& token) = 0;
};

} // namespace invoicing::ports::output
