#pragma once

#include "domain/Product.hpp"
#include <optional>
#include <string>
#include <vector>

namespace invoicing::ports::output {

/**
 * @brief Чтение товаров каталога (вместе с текущим остатком)
 */
class IProductRepository {
public:
    virtual ~IProductRepository() = default;

    virtual std::optional<domain::Product> findById(const std::string& productId) = 0;

    /**
     * @brief Пакетная загрузка; отсутствующие id просто пропускаются
     */
    virtual std::vector<domain::Product> findByIds(const std::vector<std::string>& productIds) = 0;
};

} // namespace invoicing::ports::output
