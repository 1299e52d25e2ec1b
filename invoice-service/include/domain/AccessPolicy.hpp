#pragma once

#include "InvoiceStateMachine.hpp"
#include "enums/InvoiceStatus.hpp"
#include "enums/InvoiceAction.hpp"
#include "enums/UserRole.hpp"
#include <set>
#include <optional>

namespace invoicing::domain {

/**
 * @brief Authorization Gate: чистая функция (role, action, status) → allow/deny
 *
 * Роли для переходов берутся из таблицы InvoiceStateMachine,
 * для CREATE/ADJUST_STOCK из собственной таблицы ниже.
 * Дополнительно роль должна видеть текущий статус счёта.
 */
class AccessPolicy {
public:
    static bool isAllowed(UserRole role, InvoiceAction action, InvoiceStatus status) {
        if (const Transition* t = InvoiceStateMachine::find(action)) {
            return t->grants(role) && canView(role, status);
        }
        return isAllowed(role, action);
    }

    /**
     * @brief Действия без исходного статуса (создание счёта, корректировка склада)
     */
    static bool isAllowed(UserRole role, InvoiceAction action) {
        switch (action) {
            case InvoiceAction::CREATE:
                return role == UserRole::ADMIN || role == UserRole::ACCOUNTANT;
            case InvoiceAction::ADJUST_STOCK:
                return role == UserRole::ADMIN || role == UserRole::WAREHOUSE;
            default:
                return false;
        }
    }

    /**
     * @brief Статусы, видимые роли
     * @return nullopt, если ограничений нет
     */
    static std::optional<std::set<InvoiceStatus>> visibleStatuses(UserRole role) {
        switch (role) {
            case UserRole::WAREHOUSE:
                return std::set<InvoiceStatus>{
                    InvoiceStatus::WAREHOUSE_PENDING,
                    InvoiceStatus::APPROVED,
                    InvoiceStatus::SHIPPED};
            case UserRole::ACCOUNTANT:
                // бухгалтер видит все статусы
                return std::set<InvoiceStatus>(allInvoiceStatuses().begin(), allInvoiceStatuses().end());
            case UserRole::ADMIN:
            default:
                return std::nullopt;
        }
    }

    static bool canView(UserRole role, InvoiceStatus status) {
        auto visible = visibleStatuses(role);
        return !visible || visible->count(status) > 0;
    }
};

} // namespace invoicing::domain
