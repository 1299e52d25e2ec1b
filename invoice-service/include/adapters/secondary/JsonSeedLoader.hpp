#pragma once

#include "adapters/secondary/InMemoryInvoiceStore.hpp"
#include "adapters/secondary/InMemoryCustomerRepository.hpp"
#include "adapters/secondary/InMemoryUserRepository.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace invoicing::adapters::secondary {

/**
 * @brief Начальные данные для INVOICING_STORAGE=memory
 *
 * Формат файла:
 * {
 *   "products":  [{"id", "code", "name", "unit", "quantity_available", "is_available"}],
 *   "customers": [{"id", "first_name", "last_name", "phone", "city",
 *                  "bank_accounts": [{"bank_name", "account_number", "iban"}]}],
 *   "users":     [{"id", "email", "first_name", "last_name", "role"}]
 * }
 */
class JsonSeedLoader {
public:
    static void loadFile(
        const std::string& path,
        InMemoryInvoiceStore& store,
        InMemoryCustomerRepository& customers,
        InMemoryUserRepository& users)
    {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open seed file: " + path);
        }
        load(nlohmann::json::parse(in), store, customers, users);
        std::cout << "[JsonSeedLoader] Loaded " << path << std::endl;
    }

    static void load(
        const nlohmann::json& seed,
        InMemoryInvoiceStore& store,
        InMemoryCustomerRepository& customers,
        InMemoryUserRepository& users)
    {
        for (const auto& p : seed.value("products", nlohmann::json::array())) {
            domain::Product product;
            product.id = p.at("id").get<std::string>();
            product.code = p.value("code", product.id);
            product.name = p.value("name", "");
            product.unit = p.value("unit", "meter");
            product.quantityAvailable = p.value("quantity_available", int64_t{0});
            product.isAvailable = p.value("is_available", true);
            if (product.quantityAvailable < 0) {
                throw std::runtime_error("Negative stock in seed for " + product.id);
            }
            store.addProduct(product);
        }

        for (const auto& c : seed.value("customers", nlohmann::json::array())) {
            domain::Customer customer;
            customer.id = c.at("id").get<std::string>();
            customer.firstName = c.value("first_name", "");
            customer.lastName = c.value("last_name", "");
            customer.phone = c.value("phone", "");
            customer.city = c.value("city", "");
            for (const auto& b : c.value("bank_accounts", nlohmann::json::array())) {
                customer.bankAccounts.push_back({
                    b.value("bank_name", ""),
                    b.value("account_number", ""),
                    b.value("iban", "")});
            }
            customers.add(customer);
        }

        for (const auto& u : seed.value("users", nlohmann::json::array())) {
            domain::User user;
            user.id = u.at("id").get<std::string>();
            user.email = u.value("email", "");
            user.firstName = u.value("first_name", "");
            user.lastName = u.value("last_name", "");
            user.role = domain::parseUserRole(u.value("role", "warehouse"));
            users.add(user);
        }
    }
};

} // namespace invoicing::adapters::secondary
