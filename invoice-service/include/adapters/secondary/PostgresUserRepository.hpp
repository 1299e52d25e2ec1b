#pragma once

#include "ports/output/IDirectory.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace invoicing::adapters::secondary
{

    class PostgresUserRepository : public ports::output::IUserRepository
    {
    public:
        explicit PostgresUserRepository(std::shared_ptr<settings::DbSettings> s) : settings_(std::move(s))
        {
            std::cout << "[PostgresUserRepository] Created" << std::endl;
        }

        std::optional<domain::User> findById(const std::string &userId) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            auto r = t.exec_params(
                "SELECT id, email, first_name, last_name, role FROM users WHERE id = $1", userId);
            if (r.empty())
                return std::nullopt;

            domain::User user;
            user.id = r[0]["id"].as<std::string>();
            user.email = r[0]["email"].as<std::string>();
            user.firstName = r[0]["first_name"].as<std::string>();
            user.lastName = r[0]["last_name"].as<std::string>();
            user.role = domain::parseUserRole(r[0]["role"].as<std::string>());
            return user;
        }

    private:
        std::shared_ptr<settings::DbSettings> settings_;
    };

} // namespace invoicing::adapters::secondary
