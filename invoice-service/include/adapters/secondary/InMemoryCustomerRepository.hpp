#pragma once

#include "ports/output/IDirectory.hpp"
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace invoicing::adapters::secondary {

/**
 * @brief In-memory справочник клиентов
 */
class InMemoryCustomerRepository : public ports::output::ICustomerRepository {
public:
    void add(const domain::Customer& customer) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        customers_[customer.id] = customer;
    }

    std::optional<domain::Customer> findById(const std::string& customerId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = customers_.find(customerId);
        return it != customers_.end() ? std::optional(it->second) : std::nullopt;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, domain::Customer> customers_;
};

} // namespace invoicing::adapters::secondary
