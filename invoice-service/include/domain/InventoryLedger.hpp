#pragma once

#include "InventoryTransaction.hpp"
#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace invoicing::domain {

/**
 * @brief Журнал движения товара и производные от него величины
 *
 * Хранилище только добавляет записи, расчёты делаются здесь:
 * - чистое изменение остатка по товару (сверка с quantity_available);
 * - открытый резерв счёта: |Σ reserve| − Σ release по каждому товару.
 */
class InventoryLedger {
public:
    InventoryLedger() = default;

    explicit InventoryLedger(std::vector<InventoryTransaction> entries)
        : entries_(std::move(entries)) {}

    void append(const InventoryTransaction& entry) {
        entries_.push_back(entry);
    }

    const std::vector<InventoryTransaction>& entries() const { return entries_; }

    /**
     * @brief Σ delta по товару в порядке записи
     */
    int64_t netDelta(const std::string& productId) const {
        int64_t sum = 0;
        for (const auto& e : entries_) {
            if (e.productId == productId) {
                sum += e.delta;
            }
        }
        return sum;
    }

    /**
     * @brief Открытые (не возвращённые) резервы счёта по товарам
     */
    std::map<std::string, int64_t> openReservations(const std::string& invoiceId) const {
        std::map<std::string, int64_t> open;
        for (const auto& e : entries_) {
            if (e.invoiceId != invoiceId) {
                continue;
            }
            if (e.kind == TransactionKind::RESERVE) {
                open[e.productId] += -e.delta;
            } else if (e.kind == TransactionKind::RELEASE) {
                open[e.productId] -= e.delta;
            }
        }
        for (auto it = open.begin(); it != open.end();) {
            it = (it->second == 0) ? open.erase(it) : std::next(it);
        }
        return open;
    }

    bool hasOpenReservation(const std::string& invoiceId) const {
        return !openReservations(invoiceId).empty();
    }

    /**
     * @brief Сколько товара удерживают открытые резервы всех счетов
     */
    int64_t reservedQuantity(const std::string& productId) const {
        int64_t reserved = 0;
        for (const auto& e : entries_) {
            if (e.productId != productId) {
                continue;
            }
            if (e.kind == TransactionKind::RESERVE) {
                reserved += -e.delta;
            } else if (e.kind == TransactionKind::RELEASE) {
                reserved -= e.delta;
            }
        }
        return reserved;
    }

    /**
     * @brief Проверка сверки: baseline + Σ delta == current
     */
    bool reconciles(const std::string& productId, int64_t baseline, int64_t current) const {
        return baseline + netDelta(productId) == current;
    }

private:
    std::vector<InventoryTransaction> entries_;
};

} // namespace invoicing::domain
