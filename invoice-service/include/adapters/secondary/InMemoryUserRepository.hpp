#pragma once

#include "ports/output/IDirectory.hpp"
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace invoicing::adapters::secondary {

/**
 * @brief In-memory справочник сотрудников
 */
class InMemoryUserRepository : public ports::output::IUserRepository {
public:
    void add(const domain::User& user) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        users_[user.id] = user;
    }

    std::optional<domain::User> findById(const std::string& userId) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = users_.find(userId);
        return it != users_.end() ? std::optional(it->second) : std::nullopt;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, domain::User> users_;
};

} // namespace invoicing::adapters::secondary
