#pragma once

#include "Invoice.hpp"
#include "Timestamp.hpp"
#include "enums/InvoiceStatus.hpp"
#include "enums/PaymentType.hpp"
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstdint>

namespace invoicing::domain {

/**
 * @brief Фильтры списка счетов
 *
 * visibleStatuses подставляется сервисом из роли и применяется
 * в самом запросе (до skip/limit и подсчёта total).
 * nullopt означает отсутствие ограничений.
 */
struct InvoiceFilter {
    std::optional<InvoiceStatus> status;
    std::optional<std::string> customerId;
    std::optional<PaymentType> paymentType;
    std::optional<std::string> createdBy;
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    std::optional<std::set<InvoiceStatus>> visibleStatuses;
    int skip = 0;
    int limit = 100;

    static constexpr int MAX_LIMIT = 1000;

    bool matches(const Invoice& invoice) const {
        if (visibleStatuses && visibleStatuses->count(invoice.status) == 0) return false;
        if (status && invoice.status != *status) return false;
        if (customerId && invoice.customerId != *customerId) return false;
        if (paymentType && invoice.paymentType != *paymentType) return false;
        if (createdBy && invoice.createdBy != *createdBy) return false;
        if (from && invoice.createdAt < *from) return false;
        if (to && invoice.createdAt > *to) return false;
        return true;
    }
};

struct InvoicePage {
    std::vector<Invoice> items;
    int64_t total = 0;
};

} // namespace invoicing::domain
