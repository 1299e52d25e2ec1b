#pragma once

#include <string>
#include <stdexcept>

namespace invoicing::domain {

/**
 * @brief Действия, проходящие через Authorization Gate
 *
 * RESERVE..CANCEL меняют статус счёта.
 * CREATE и ADJUST_STOCK не меняют статус, но тоже требуют роли.
 */
enum class InvoiceAction {
    CREATE,
    RESERVE,
    APPROVE,
    SHIP,
    DELIVER,
    CANCEL,
    ADJUST_STOCK
};

inline std::string toString(InvoiceAction action) {
    switch (action) {
        case InvoiceAction::CREATE: return "create";
        case InvoiceAction::RESERVE: return "reserve";
        case InvoiceAction::APPROVE: return "approve";
        case InvoiceAction::SHIP: return "ship";
        case InvoiceAction::DELIVER: return "deliver";
        case InvoiceAction::CANCEL: return "cancel";
        case InvoiceAction::ADJUST_STOCK: return "adjust";
        default: return "unknown";
    }
}

inline InvoiceAction parseInvoiceAction(const std::string& str) {
    if (str == "create") return InvoiceAction::CREATE;
    if (str == "reserve") return InvoiceAction::RESERVE;
    if (str == "approve") return InvoiceAction::APPROVE;
    if (str == "ship") return InvoiceAction::SHIP;
    if (str == "deliver") return InvoiceAction::DELIVER;
    if (str == "cancel") return InvoiceAction::CANCEL;
    if (str == "adjust") return InvoiceAction::ADJUST_STOCK;
    throw std::invalid_argument("Unknown action: " + str);
}

} // namespace invoicing::domain
