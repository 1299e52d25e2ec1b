#pragma once

#include "Timestamp.hpp"
#include "enums/TransactionKind.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace invoicing::domain {

/**
 * @brief Запись журнала склада (append-only)
 *
 * delta < 0 для списания (reserve), delta > 0 для возврата (release),
 * ship-mark всегда 0. invoiceId пуст для ручных корректировок.
 */
struct InventoryTransaction {
    std::string id;
    std::string productId;
    std::string invoiceId;
    TransactionKind kind = TransactionKind::ADJUST;
    int64_t delta = 0;
    std::string createdBy;
    std::string notes;
    Timestamp createdAt;
};

/**
 * @brief Фильтр выборки журнала
 */
struct TransactionFilter {
    std::optional<std::string> productId;
    std::optional<std::string> invoiceId;
    std::optional<TransactionKind> kind;
    int skip = 0;
    int limit = 100;
};

} // namespace invoicing::domain
