#pragma once

#include <string>
#include <stdexcept>

namespace invoicing::domain {

enum class PaymentType {
    CASH,
    CHECK,
    MIXED
};

inline std::string toString(PaymentType type) {
    switch (type) {
        case PaymentType::CASH: return "cash";
        case PaymentType::CHECK: return "check";
        case PaymentType::MIXED: return "mixed";
        default: return "unknown";
    }
}

inline PaymentType parsePaymentType(const std::string& str) {
    if (str == "cash") return PaymentType::CASH;
    if (str == "check") return PaymentType::CHECK;
    if (str == "mixed") return PaymentType::MIXED;
    throw std::invalid_argument("Unknown payment type: " + str);
}

} // namespace invoicing::domain
