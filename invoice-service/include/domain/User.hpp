#pragma once

#include "enums/UserRole.hpp"
#include <string>

namespace invoicing::domain {

/**
 * @brief Сотрудник (создатель счёта)
 */
struct User {
    std::string id;
    std::string email;
    std::string firstName;
    std::string lastName;
    UserRole role = UserRole::WAREHOUSE;
};

/**
 * @brief Аутентифицированный инициатор запроса
 */
struct Actor {
    std::string userId;
    UserRole role = UserRole::WAREHOUSE;
};

} // namespace invoicing::domain
