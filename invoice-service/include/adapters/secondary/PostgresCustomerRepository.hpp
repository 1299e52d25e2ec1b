#pragma once

#include "ports/output/IDirectory.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace invoicing::adapters::secondary
{

    /**
     * @brief Клиенты и их банковские счета из PostgreSQL
     */
    class PostgresCustomerRepository : public ports::output::ICustomerRepository
    {
    public:
        explicit PostgresCustomerRepository(std::shared_ptr<settings::DbSettings> s) : settings_(std::move(s))
        {
            std::cout << "[PostgresCustomerRepository] Created" << std::endl;
        }

        std::optional<domain::Customer> findById(const std::string &customerId) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            auto r = t.exec_params(
                "SELECT id, first_name, last_name, phone, city FROM customers WHERE id = $1", customerId);
            if (r.empty())
                return std::nullopt;

            domain::Customer customer;
            customer.id = r[0]["id"].as<std::string>();
            customer.firstName = r[0]["first_name"].as<std::string>();
            customer.lastName = r[0]["last_name"].as<std::string>();
            customer.phone = r[0]["phone"].as<std::string>();
            customer.city = r[0]["city"].as<std::string>();

            auto accounts = t.exec_params(
                "SELECT bank_name, account_number, iban FROM bank_accounts WHERE customer_id = $1 ORDER BY id",
                customerId);
            for (const auto &row : accounts)
            {
                customer.bankAccounts.push_back({
                    row["bank_name"].as<std::string>(),
                    row["account_number"].as<std::string>(),
                    row["iban"].as<std::string>()});
            }
            return customer;
        }

    private:
        std::shared_ptr<settings::DbSettings> settings_;
    };

} // namespace invoicing::adapters::secondary
