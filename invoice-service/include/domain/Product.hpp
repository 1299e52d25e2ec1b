#pragma once

#include <string>
#include <cstdint>

namespace invoicing::domain {

/**
 * @brief Товар каталога
 *
 * Каталог внешний, здесь нам принадлежит только quantityAvailable,
 * и меняется он исключительно через записи журнала.
 */
struct Product {
    std::string id;
    std::string code;
    std::string name;
    std::string unit;
    int64_t quantityAvailable = 0;
    bool isAvailable = true;
};

} // namespace invoicing::domain
