#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace invoicing::utils {

/**
 * @brief Генератор идентификаторов вида "inv-0123456789abcdef"
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    static std::string generateWithPrefix(const std::string& prefix) {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(16) << dist(gen);
        return ss.str();
    }

    static std::string invoiceId() { return generateWithPrefix("inv"); }
    static std::string transactionId() { return generateWithPrefix("txn"); }
};

} // namespace invoicing::utils
