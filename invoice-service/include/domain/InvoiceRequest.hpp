#pragma once

#include "Money.hpp"
#include "InvoiceItem.hpp"
#include "enums/PaymentType.hpp"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace invoicing::domain {

struct InvoiceItemRequest {
    std::string productId;
    int64_t quantity = 0;
    std::string unit;
    Money unitPrice;
    std::optional<int64_t> rollsCount;
    std::optional<int64_t> piecesPerRoll;
    std::vector<RollDetail> detailedRolls;
};

/**
 * @brief Запрос на создание счёта
 */
struct CreateInvoiceRequest {
    std::string customerId;
    PaymentType paymentType = PaymentType::CASH;
    std::map<std::string, Money> paymentBreakdown;
    std::vector<InvoiceItemRequest> items;
};

/**
 * @brief Ручная корректировка остатка (инвентаризация, приход)
 */
struct StockAdjustmentRequest {
    std::string productId;
    int64_t delta = 0;
    std::string notes;
};

} // namespace invoicing::domain
