#pragma once

#include <string>
#include <stdexcept>

namespace invoicing::domain {

enum class UserRole {
    ADMIN,
    ACCOUNTANT,
    WAREHOUSE
};

inline std::string toString(UserRole role) {
    switch (role) {
        case UserRole::ADMIN: return "admin";
        case UserRole::ACCOUNTANT: return "accountant";
        case UserRole::WAREHOUSE: return "warehouse";
        default: return "unknown";
    }
}

inline UserRole parseUserRole(const std::string& str) {
    if (str == "admin") return UserRole::ADMIN;
    if (str == "accountant") return UserRole::ACCOUNTANT;
    if (str == "warehouse") return UserRole::WAREHOUSE;
    throw std::invalid_argument("Unknown user role: " + str);
}

} // namespace invoicing::domain
