#pragma once

#include "ports/input/IInventoryService.hpp"
#include "ports/output/IInvoiceStore.hpp"
#include "ports/output/IProductRepository.hpp"
#include "application/UnitOfWorkRunner.hpp"
#include "settings/LockSettings.hpp"
#include "domain/AccessPolicy.hpp"
#include "domain/InventoryLedger.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <memory>
#include <iostream>

namespace invoicing::application {

/**
 * @brief Журнал склада, остатки и ручные корректировки
 */
class InventoryService : public ports::input::IInventoryService {
public:
    InventoryService(
        std::shared_ptr<ports::output::IInvoiceStore> store,
        std::shared_ptr<ports::output::IProductRepository> products,
        std::shared_ptr<settings::LockSettings> lockSettings
    ) : store_(store)
      , products_(std::move(products))
      , runner_(store, std::move(lockSettings))
    {
        std::cout << "[InventoryService] Created" << std::endl;
    }

    std::vector<domain::InventoryTransaction> listTransactions(
        const domain::Actor& /*actor*/,
        const domain::TransactionFilter& filter) override
    {
        if (filter.skip < 0) {
            throw domain::ValidationException("skip must not be negative");
        }
        if (filter.limit <= 0 || filter.limit > domain::InvoiceFilter::MAX_LIMIT) {
            throw domain::ValidationException(
                "limit must be between 1 and " + std::to_string(domain::InvoiceFilter::MAX_LIMIT));
        }
        return store_->findTransactions(filter);
    }

    domain::ProductStock getProductStock(
        const domain::Actor& /*actor*/,
        const std::string& productId) override
    {
        auto product = products_->findById(productId);
        if (!product) {
            throw domain::NotFoundException("Product", productId);
        }

        domain::InventoryLedger ledger(store_->transactionsForProduct(productId));

        domain::ProductStock stock;
        stock.productId = product->id;
        stock.name = product->name;
        stock.quantityAvailable = product->quantityAvailable;
        stock.reservedQuantity = ledger.reservedQuantity(productId);
        return stock;
    }

    domain::InventoryTransaction adjustStock(
        const domain::Actor& actor,
        const domain::StockAdjustmentRequest& request) override
    {
        if (!domain::AccessPolicy::isAllowed(actor.role, domain::InvoiceAction::ADJUST_STOCK)) {
            throw domain::ForbiddenException(actor.role, domain::InvoiceAction::ADJUST_STOCK);
        }
        if (request.productId.empty()) {
            throw domain::ValidationException("product_id is required");
        }
        if (request.delta == 0) {
            throw domain::ValidationException("delta must not be zero");
        }

        ports::output::LockSet locks{"", {request.productId}};

        auto written = runner_.run(locks, [&](ports::output::IUnitOfWork& uow) {
            auto product = uow.findProduct(request.productId);
            if (!product) {
                throw domain::NotFoundException("Product", request.productId);
            }
            if (product->quantityAvailable + request.delta < 0) {
                domain::StockShortfall shortfall{product->id, -request.delta, product->quantityAvailable};
                throw domain::InsufficientStockException({shortfall});
            }

            domain::InventoryTransaction txn;
            txn.id = utils::IdGenerator::transactionId();
            txn.productId = product->id;
            txn.kind = domain::TransactionKind::ADJUST;
            txn.delta = request.delta;
            txn.createdBy = actor.userId;
            txn.notes = request.notes.empty() ? "Manual adjustment" : request.notes;
            txn.createdAt = domain::Timestamp::now();

            uow.appendTransaction(txn);
            uow.commit();
            return txn;
        });

        std::cout << "[InventoryService] Adjusted " << written.productId << " by " << written.delta
                  << " (" << actor.userId << ")" << std::endl;
        return written;
    }

private:
    std::shared_ptr<ports::output::IInvoiceStore> store_;
    std::shared_ptr<ports::output::IProductRepository> products_;
    UnitOfWorkRunner runner_;
};

} // namespace invoicing::application
