#pragma once

#include "domain/Customer.hpp"
#include "domain/User.hpp"
#include <optional>
#include <string>

namespace invoicing::ports::output {

/**
 * @brief Справочник клиентов (внешний сервис)
 */
class ICustomerRepository {
public:
    virtual ~ICustomerRepository() = default;

    /**
     * @brief Клиент вместе с банковскими счетами
     */
    virtual std::optional<domain::Customer> findById(const std::string& customerId) = 0;
};

/**
 * @brief Справочник сотрудников (внешний сервис)
 */
class IUserRepository {
public:
    virtual ~IUserRepository() = default;
    virtual std::optional<domain::User> findById(const std::string& userId) = 0;
};

} // namespace invoicing::ports::output
