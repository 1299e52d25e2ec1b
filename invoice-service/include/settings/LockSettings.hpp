#pragma once

#include <chrono>
#include <string>
#include <cstdlib>

namespace invoicing::settings {

/**
 * @brief Ожидание блокировок единицы работы
 *
 * - INVOICING_LOCK_RETRIES: повторы при конкуренции за блокировку (default: 3)
 * - INVOICING_LOCK_TIMEOUT_MS: ожидание одной блокировки (default: 200)
 */
class LockSettings {
public:
    LockSettings() {
        if (const char* retries = std::getenv("INVOICING_LOCK_RETRIES")) {
            retries_ = std::stoi(retries);
        }
        if (const char* timeout = std::getenv("INVOICING_LOCK_TIMEOUT_MS")) {
            timeoutMs_ = std::stoi(timeout);
        }
    }

    int getRetries() const { return retries_; }
    std::chrono::milliseconds getLockTimeout() const { return std::chrono::milliseconds(timeoutMs_); }

private:
    int retries_ = 3;
    int timeoutMs_ = 200;
};

} // namespace invoicing::settings
