#pragma once

#include "ports/output/IProductRepository.hpp"
#include "adapters/secondary/InMemoryInvoiceStore.hpp"
#include <memory>

namespace invoicing::adapters::secondary {

/**
 * @brief Каталог товаров поверх InMemoryInvoiceStore
 *
 * Остатки живут в хранилище, т.к. меняются в одной единице работы с журналом.
 */
class InMemoryProductRepository : public ports::output::IProductRepository {
public:
    explicit InMemoryProductRepository(std::shared_ptr<InMemoryInvoiceStore> store)
        : store_(std::move(store)) {}

    std::optional<domain::Product> findById(const std::string& productId) override {
        return store_->findProduct(productId);
    }

    std::vector<domain::Product> findByIds(const std::vector<std::string>& productIds) override {
        return store_->findProducts(productIds);
    }

private:
    std::shared_ptr<InMemoryInvoiceStore> store_;
};

} // namespace invoicing::adapters::secondary
