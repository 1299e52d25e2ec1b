#pragma once

#include "InvoiceItem.hpp"
#include "TrackingInfo.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include "enums/InvoiceStatus.hpp"
#include "enums/PaymentType.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <sstream>
#include <iomanip>

namespace invoicing::domain {

/**
 * @brief Счёт-фактура
 *
 * Строки задаются только в конструкторе: после создания меняются
 * исключительно статус, tracking и updatedAt (через переходы).
 */
class Invoice {
public:
    std::string id;
    std::string number;
    std::string customerId;
    std::string createdBy;
    InvoiceStatus status = InvoiceStatus::WAREHOUSE_PENDING;
    PaymentType paymentType = PaymentType::CASH;
    std::map<std::string, Money> paymentBreakdown;
    std::optional<TrackingInfo> tracking;
    Timestamp createdAt;
    Timestamp updatedAt;

    Invoice() = default;

    explicit Invoice(std::vector<InvoiceItem> items)
        : items_(std::move(items))
    {}

    const std::vector<InvoiceItem>& items() const { return items_; }

    Money subtotal() const {
        Money sum;
        if (!items_.empty()) {
            sum.currency = items_.front().unitPrice.currency;
        }
        for (const auto& item : items_) {
            sum = sum + item.lineTotal();
        }
        return sum;
    }

    // Налоги и скидки вне нашей зоны: total == subtotal
    Money total() const { return subtotal(); }

    int64_t totalQuantity() const {
        int64_t sum = 0;
        for (const auto& item : items_) {
            sum += item.quantity;
        }
        return sum;
    }

    /**
     * @brief Уникальные product id по возрастанию, в порядке захвата блокировок
     */
    std::vector<std::string> productIds() const {
        std::set<std::string> ids;
        for (const auto& item : items_) {
            ids.insert(item.productId);
        }
        return {ids.begin(), ids.end()};
    }

    void transitionTo(InvoiceStatus newStatus) {
        status = newStatus;
        updatedAt = Timestamp::now();
    }

    /**
     * @brief Год нумерации: солнечный год хиджры, приближённо григорианский минус 621
     */
    static int numberingYear(const Timestamp& createdAt) {
        return createdAt.year() - 621;
    }

    /**
     * @brief Номер вида INV-1403-007
     */
    static std::string formatNumber(int year, int64_t sequence) {
        std::ostringstream ss;
        ss << "INV-" << year << "-" << std::setfill('0') << std::setw(3) << sequence;
        return ss.str();
    }

private:
    std::vector<InvoiceItem> items_;
};

} // namespace invoicing::domain
