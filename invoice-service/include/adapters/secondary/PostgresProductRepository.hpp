#pragma once

#include "ports/output/IProductRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace invoicing::adapters::secondary
{

    class PostgresProductRepository : public ports::output::IProductRepository
    {
    public:
        explicit PostgresProductRepository(std::shared_ptr<settings::DbSettings> s) : settings_(std::move(s))
        {
            std::cout << "[PostgresProductRepository] Created" << std::endl;
        }

        std::optional<domain::Product> findById(const std::string &productId) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT id, code, name, unit, quantity_available, is_available FROM products WHERE id = $1", productId);
            if (r.empty())
                return std::nullopt;
            return toProduct(r[0]);
        }

        std::vector<domain::Product> findByIds(const std::vector<std::string> &productIds) override
        {
            std::vector<domain::Product> products;
            if (productIds.empty())
                return products;

            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            std::string ids;
            for (const auto &id : productIds)
            {
                if (!ids.empty())
                    ids += ", ";
                ids += t.quote(id);
            }

            auto r = t.exec(
                "SELECT id, code, name, unit, quantity_available, is_available FROM products WHERE id IN (" + ids + ")");
            for (const auto &row : r)
                products.push_back(toProduct(row));
            return products;
        }

    private:
        std::shared_ptr<settings::DbSettings> settings_;

        static domain::Product toProduct(const pqxx::row &row)
        {
            domain::Product p;
            p.id = row["id"].as<std::string>();
            p.code = row["code"].as<std::string>();
            p.name = row["name"].as<std::string>();
            p.unit = row["unit"].as<std::string>();
            p.quantityAvailable = row["quantity_available"].as<int64_t>();
            p.isAvailable = row["is_available"].as<bool>();
            return p;
        }
    };

} // namespace invoicing::adapters::secondary
