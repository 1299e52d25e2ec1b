#pragma once

#include <string>
#include <vector>
#include <stdexcept>

namespace invoicing::domain {

enum class InvoiceStatus {
    WAREHOUSE_PENDING,
    ACCOUNTANT_PENDING,
    APPROVED,
    SHIPPED,
    DELIVERED,
    CANCELLED
};

inline std::string toString(InvoiceStatus status) {
    switch (status) {
        case InvoiceStatus::WAREHOUSE_PENDING: return "warehouse_pending";
        case InvoiceStatus::ACCOUNTANT_PENDING: return "accountant_pending";
        case InvoiceStatus::APPROVED: return "approved";
        case InvoiceStatus::SHIPPED: return "shipped";
        case InvoiceStatus::DELIVERED: return "delivered";
        case InvoiceStatus::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

/**
 * @throws std::invalid_argument для неизвестного значения
 */
inline InvoiceStatus parseInvoiceStatus(const std::string& str) {
    if (str == "warehouse_pending") return InvoiceStatus::WAREHOUSE_PENDING;
    if (str == "accountant_pending") return InvoiceStatus::ACCOUNTANT_PENDING;
    if (str == "approved") return InvoiceStatus::APPROVED;
    if (str == "shipped") return InvoiceStatus::SHIPPED;
    if (str == "delivered") return InvoiceStatus::DELIVERED;
    if (str == "cancelled") return InvoiceStatus::CANCELLED;
    throw std::invalid_argument("Unknown invoice status: " + str);
}

inline const std::vector<InvoiceStatus>& allInvoiceStatuses() {
    static const std::vector<InvoiceStatus> all = {
        InvoiceStatus::WAREHOUSE_PENDING,
        InvoiceStatus::ACCOUNTANT_PENDING,
        InvoiceStatus::APPROVED,
        InvoiceStatus::SHIPPED,
        InvoiceStatus::DELIVERED,
        InvoiceStatus::CANCELLED
    };
    return all;
}

} // namespace invoicing::domain
