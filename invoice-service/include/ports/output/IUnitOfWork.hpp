#pragma once

#include "domain/Invoice.hpp"
#include "domain/Product.hpp"
#include "domain/InventoryTransaction.hpp"
#include "domain/enums/InvoiceStatus.hpp"
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

namespace invoicing::ports::output {

/**
 * @brief Не удалось захватить блокировку за отведённое время
 *
 * Внутреннее состояние: UnitOfWorkRunner повторяет попытку и лишь затем
 * превращает его в ConflictException.
 */
class LockContentionException : public std::runtime_error {
public:
    explicit LockContentionException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Что нужно заблокировать на время единицы работы
 *
 * Сначала счёт (если задан), затем товары по возрастанию id.
 */
struct LockSet {
    std::string invoiceId;
    std::vector<std::string> productIds;
};

/**
 * @brief Единица работы: статус счёта и записи журнала фиксируются вместе
 *
 * Деструктор без commit() откатывает всё, что было сделано.
 */
class IUnitOfWork {
public:
    virtual ~IUnitOfWork() = default;

    virtual std::optional<domain::Invoice> findInvoice(const std::string& invoiceId) = 0;

    /**
     * @brief Товар с учётом изменений, уже сделанных в этой единице работы
     */
    virtual std::optional<domain::Product> findProduct(const std::string& productId) = 0;

    virtual std::vector<domain::InventoryTransaction> transactionsForInvoice(const std::string& invoiceId) = 0;

    /**
     * @brief Добавить запись журнала и применить delta к quantity_available
     * @throws NotFoundException товар не найден
     * @throws InsufficientStockException остаток ушёл бы в минус
     */
    virtual void appendTransaction(const domain::InventoryTransaction& txn) = 0;

    /**
     * @brief Записать статус/tracking при условии, что статус всё ещё expected
     * @return false если статус уже изменился (проигранная гонка)
     */
    virtual bool updateInvoice(const domain::Invoice& invoice, domain::InvoiceStatus expected) = 0;

    virtual void commit() = 0;
};

} // namespace invoicing::ports::output
