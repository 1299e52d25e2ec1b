#pragma once

#include <string>
#include <cstdint>
#include <cmath>

namespace invoicing::domain {

/**
 * @brief Денежное значение с валютой
 *
 * units + nano (10^-9), как в Tinkoff API: без накопления ошибок double
 * при суммировании строк счёта.
 */
class Money {
public:
    int64_t units = 0;
    int32_t nano = 0;
    std::string currency = "IRR";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "IRR")
        : units(u), nano(n), currency(cur) {}

    static Money fromDouble(double value, const std::string& cur = "IRR") {
        Money m;
        m.currency = cur;
        m.units = static_cast<int64_t>(value);
        m.nano = static_cast<int32_t>(std::llround((value - static_cast<double>(m.units)) * 1e9));
        m.normalize();
        return m;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    bool isNegative() const {
        return units < 0 || (units == 0 && nano < 0);
    }

    Money operator+(const Money& other) const {
        Money result(units + other.units, nano + other.nano, currency);
        result.normalize();
        return result;
    }

    /**
     * @brief Умножение на целое количество (цена × метраж)
     */
    Money operator*(int64_t multiplier) const {
        int64_t totalNano = static_cast<int64_t>(nano) * multiplier;
        Money result;
        result.currency = currency;
        result.units = units * multiplier + totalNano / 1000000000;
        result.nano = static_cast<int32_t>(totalNano % 1000000000);
        result.normalize();
        return result;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }

private:
    void normalize() {
        if (nano >= 1000000000) {
            units += nano / 1000000000;
            nano %= 1000000000;
        } else if (nano < 0 && units > 0) {
            units--;
            nano += 1000000000;
        }
    }
};

} // namespace invoicing::domain
