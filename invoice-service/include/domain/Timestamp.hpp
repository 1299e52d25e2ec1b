#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

namespace invoicing::domain {

/**
 * @brief Временная метка (UTC, при сериализации с точностью до секунды)
 */
class Timestamp {
public:
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Парсинг ISO 8601: "2024-03-01T10:15:00Z" или просто "2024-03-01"
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& str) {
        std::tm tm = {};
        std::istringstream ss(str);
        if (str.find('T') != std::string::npos) {
            ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        }
        if (ss.fail()) {
            throw std::invalid_argument("Invalid timestamp: " + str);
        }
        // время всегда в UTC, mktime здесь не подходит
        auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
        return Timestamp(tp);
    }

    /**
     * @brief Конец суток для даты без времени ("2024-03-01" → 23:59:59)
     */
    static Timestamp endOfDay(const std::string& str) {
        auto ts = fromString(str);
        if (str.find('T') == std::string::npos) {
            ts.value += std::chrono::hours(24) - std::chrono::seconds(1);
        }
        return ts;
    }

    std::string toString() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    int year() const {
        auto time_t_val = std::chrono::system_clock::to_time_t(value);
        std::tm tm = *std::gmtime(&time_t_val);
        return tm.tm_year + 1900;
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
};

} // namespace invoicing::domain
