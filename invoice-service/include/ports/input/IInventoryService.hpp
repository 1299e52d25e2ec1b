#pragma once

#include "domain/InventoryTransaction.hpp"
#include "domain/InvoiceView.hpp"
#include "domain/InvoiceRequest.hpp"
#include "domain/User.hpp"
#include <string>
#include <vector>

namespace invoicing::ports::input {

/**
 * @brief Журнал склада и остатки
 */
class IInventoryService {
public:
    virtual ~IInventoryService() = default;

    virtual std::vector<domain::InventoryTransaction> listTransactions(
        const domain::Actor& actor,
        const domain::TransactionFilter& filter) = 0;

    virtual domain::ProductStock getProductStock(
        const domain::Actor& actor,
        const std::string& productId) = 0;

    virtual domain::InventoryTransaction adjustStock(
        const domain::Actor& actor,
        const domain::StockAdjustmentRequest& request) = 0;
};

} // namespace invoicing::ports::input
