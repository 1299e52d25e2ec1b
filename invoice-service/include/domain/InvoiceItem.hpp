#pragma once

#include "Money.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace invoicing::domain {

/**
 * @brief Рулон с замером каждого куска в базовых единицах товара
 */
struct RollDetail {
    std::vector<int64_t> pieces;
};

/**
 * @brief Строка счёта
 *
 * Неизменяема после создания счёта: quantity является единственным источником
 * истины для объёма резерва и возврата на склад.
 */
struct InvoiceItem {
    std::string productId;
    int64_t quantity = 0;
    std::string unit;
    Money unitPrice;

    // Поштучный ввод рулонами: quantity = rollsCount * piecesPerRoll
    std::optional<int64_t> rollsCount;
    std::optional<int64_t> piecesPerRoll;

    // Замеры по рулонам: quantity = сумма всех кусков, приоритетнее rollsCount
    std::vector<RollDetail> detailedRolls;

    Money lineTotal() const {
        return unitPrice * quantity;
    }
};

} // namespace invoicing::domain
