#pragma once

#include "ports/output/IUnitOfWork.hpp"
#include "domain/Invoice.hpp"
#include "domain/InventoryLedger.hpp"
#include "domain/User.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <vector>
#include <iostream>

namespace invoicing::application {

/**
 * @brief Возврат резерва при отмене счёта
 *
 * Возвращается только то, что по журналу ещё удерживается счётом:
 * по строке release c delta = +quantity, точная инверсия reserve.
 * Счёт без резерва (warehouse_pending) журнал не трогает.
 */
class CompensationEngine {
public:
    std::vector<domain::InventoryTransaction> release(
        ports::output::IUnitOfWork& uow,
        const domain::Invoice& invoice,
        const domain::Actor& actor)
    {
        domain::InventoryLedger ledger(uow.transactionsForInvoice(invoice.id));
        auto open = ledger.openReservations(invoice.id);

        std::vector<domain::InventoryTransaction> written;
        if (open.empty()) {
            return written;
        }

        for (const auto& item : invoice.items()) {
            auto it = open.find(item.productId);
            if (it == open.end() || it->second <= 0) {
                continue;
            }

            int64_t quantity = std::min(item.quantity, it->second);
            it->second -= quantity;

            domain::InventoryTransaction txn;
            txn.id = utils::IdGenerator::transactionId();
            txn.productId = item.productId;
            txn.invoiceId = invoice.id;
            txn.kind = domain::TransactionKind::RELEASE;
            txn.delta = quantity;
            txn.createdBy = actor.userId;
            txn.notes = "Returned from cancelled invoice " + invoice.number;
            txn.createdAt = domain::Timestamp::now();

            uow.appendTransaction(txn);
            written.push_back(txn);
        }

        std::cout << "[CompensationEngine] " << invoice.number << ": released "
                  << written.size() << " line(s)" << std::endl;
        return written;
    }
};

} // namespace invoicing::application
