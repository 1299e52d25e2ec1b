#pragma once

#include <string>
#include <stdexcept>

namespace invoicing::domain {

enum class TransactionKind {
    RESERVE,
    RELEASE,
    SHIP_MARK,
    ADJUST
};

inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::RESERVE: return "reserve";
        case TransactionKind::RELEASE: return "release";
        case TransactionKind::SHIP_MARK: return "ship-mark";
        case TransactionKind::ADJUST: return "adjust";
        default: return "unknown";
    }
}

inline TransactionKind parseTransactionKind(const std::string& str) {
    if (str == "reserve") return TransactionKind::RESERVE;
    if (str == "release") return TransactionKind::RELEASE;
    if (str == "ship-mark") return TransactionKind::SHIP_MARK;
    if (str == "adjust") return TransactionKind::ADJUST;
    throw std::invalid_argument("Unknown transaction kind: " + str);
}

} // namespace invoicing::domain
