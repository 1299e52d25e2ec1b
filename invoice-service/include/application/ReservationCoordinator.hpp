#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "domain/Invoice.hpp"
#include "domain/InventoryTransaction.hpp"
#include "domain/User.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <map>
#include <vector>
#include <iostream>

namespace invoicing::application {

/**
 * @brief Резервирование склада под строки счёта
 *
 * Проверка и списание идут одним блоком: либо хватает всего, либо
 * не списывается ничего и InsufficientStockException перечисляет
 * все недостающие товары. Вызывающий держит блокировки товаров.
 */
class ReservationCoordinator {
public:
    std::vector<domain::InventoryTransaction> reserve(
        ports::output::IUnitOfWork& uow,
        const domain::Invoice& invoice,
        const domain::Actor& actor)
    {
        // один товар может встречаться в нескольких строках
        std::map<std::string, int64_t> required;
        for (const auto& item : invoice.items()) {
            required[item.productId] += item.quantity;
        }

        std::vector<domain::StockShortfall> shortfalls;
        for (const auto& [productId, quantity] : required) {
            auto product = uow.findProduct(productId);
            if (!product) {
                throw domain::NotFoundException("Product", productId);
            }
            if (product->quantityAvailable < quantity) {
                shortfalls.push_back({productId, quantity, product->quantityAvailable});
            }
        }

        if (!shortfalls.empty()) {
            std::cout << "[ReservationCoordinator] " << invoice.number << ": "
                      << shortfalls.size() << " product(s) short" << std::endl;
            throw domain::InsufficientStockException(std::move(shortfalls));
        }

        std::vector<domain::InventoryTransaction> written;
        for (const auto& item : invoice.items()) {
            domain::InventoryTransaction txn;
            txn.id = utils::IdGenerator::transactionId();
            txn.productId = item.productId;
            txn.invoiceId = invoice.id;
            txn.kind = domain::TransactionKind::RESERVE;
            txn.delta = -item.quantity;
            txn.createdBy = actor.userId;
            txn.notes = "Reserved for invoice " + invoice.number;
            txn.createdAt = domain::Timestamp::now();

            uow.appendTransaction(txn);
            written.push_back(txn);
        }

        return written;
    }
};

} // namespace invoicing::application
