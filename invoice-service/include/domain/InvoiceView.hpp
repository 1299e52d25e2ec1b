#pragma once

#include "Invoice.hpp"
#include "Product.hpp"
#include "Customer.hpp"
#include "User.hpp"
#include <vector>
#include <cstdint>

namespace invoicing::domain {

struct ResolvedItem {
    InvoiceItem item;
    Product product;
};

/**
 * @brief Полностью собранный счёт для ответа клиенту
 *
 * Товары, клиент (с банковскими счетами) и создатель загружены заранее,
 * ленивых ссылок наружу не уходит.
 */
struct InvoiceView {
    Invoice invoice;
    std::vector<ResolvedItem> items;
    Customer customer;
    User creator;
};

struct InvoiceViewPage {
    std::vector<InvoiceView> items;
    int64_t total = 0;
    int skip = 0;
    int limit = 0;
};

/**
 * @brief Остаток товара: доступно и удерживается открытыми резервами
 */
struct ProductStock {
    std::string productId;
    std::string name;
    int64_t quantityAvailable = 0;
    int64_t reservedQuantity = 0;
};

} // namespace invoicing::domain
