#pragma once

#include "IUnitOfWork.hpp"
#include "domain/Invoice.hpp"
#include "domain/InvoiceFilter.hpp"
#include "domain/InventoryTransaction.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace invoicing::ports::output {

/**
 * @brief Хранилище счетов и журнала склада
 */
class IInvoiceStore {
public:
    virtual ~IInvoiceStore() = default;

    /**
     * @brief Открыть единицу работы, захватив блокировки из locks
     * @throws LockContentionException если блокировки не получены вовремя
     */
    virtual std::unique_ptr<IUnitOfWork> begin(const LockSet& locks) = 0;

    /**
     * @brief Сохранить новый счёт, атомарно выделив номер INV-<год хиджры>-<NNN>
     * @return счёт с присвоенным number
     */
    virtual domain::Invoice insert(const domain::Invoice& invoice) = 0;

    virtual std::optional<domain::Invoice> findById(const std::string& invoiceId) = 0;

    /**
     * @brief Страница счетов, новые первыми; total считается с учётом всех фильтров
     */
    virtual domain::InvoicePage find(const domain::InvoiceFilter& filter) = 0;

    /**
     * @brief Выборка журнала, новые записи первыми
     */
    virtual std::vector<domain::InventoryTransaction> findTransactions(const domain::TransactionFilter& filter) = 0;

    /**
     * @brief Все записи по товару в порядке создания
     */
    virtual std::vector<domain::InventoryTransaction> transactionsForProduct(const std::string& productId) = 0;
};

} // namespace invoicing::ports::output
