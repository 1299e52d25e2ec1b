#pragma once

#include "Errors.hpp"
#include "enums/InvoiceStatus.hpp"
#include "enums/InvoiceAction.hpp"
#include "enums/UserRole.hpp"
#include <vector>
#include <algorithm>

namespace invoicing::domain {

/**
 * @brief Побочный эффект перехода, выполняемый в той же единице работы
 */
enum class SideEffect {
    NONE,
    RESERVE_STOCK,
    MARK_SHIPPED,
    RELEASE_STOCK
};

/**
 * @brief Строка таблицы переходов: (действие, исходные статусы, роли, эффект, результат)
 */
struct Transition {
    InvoiceAction action;
    std::vector<InvoiceStatus> sources;
    std::vector<UserRole> roles;
    SideEffect effect;
    InvoiceStatus target;

    bool permits(InvoiceStatus current) const {
        return std::find(sources.begin(), sources.end(), current) != sources.end();
    }

    bool grants(UserRole role) const {
        return std::find(roles.begin(), roles.end(), role) != roles.end();
    }
};

/**
 * @brief Конечный автомат счёта
 *
 * warehouse_pending → accountant_pending → approved → shipped → delivered,
 * cancelled достижим из warehouse_pending, accountant_pending и approved.
 * Отмена после отгрузки запрещена: товар физически покинул склад.
 *
 * Любое решение о переходе принимается поиском по таблице.
 */
class InvoiceStateMachine {
public:
    static const std::vector<Transition>& table() {
        static const std::vector<Transition> transitions = {
            {InvoiceAction::RESERVE,
             {InvoiceStatus::WAREHOUSE_PENDING},
             {UserRole::WAREHOUSE, UserRole::ADMIN},
             SideEffect::RESERVE_STOCK,
             InvoiceStatus::ACCOUNTANT_PENDING},
            {InvoiceAction::APPROVE,
             {InvoiceStatus::ACCOUNTANT_PENDING},
             {UserRole::ACCOUNTANT, UserRole::ADMIN},
             SideEffect::NONE,
             InvoiceStatus::APPROVED},
            {InvoiceAction::SHIP,
             {InvoiceStatus::APPROVED},
             {UserRole::WAREHOUSE, UserRole::ADMIN},
             SideEffect::MARK_SHIPPED,
             InvoiceStatus::SHIPPED},
            {InvoiceAction::DELIVER,
             {InvoiceStatus::SHIPPED},
             {UserRole::WAREHOUSE, UserRole::ADMIN},
             SideEffect::NONE,
             InvoiceStatus::DELIVERED},
            {InvoiceAction::CANCEL,
             {InvoiceStatus::WAREHOUSE_PENDING, InvoiceStatus::ACCOUNTANT_PENDING, InvoiceStatus::APPROVED},
             {UserRole::ACCOUNTANT, UserRole::ADMIN},
             SideEffect::RELEASE_STOCK,
             InvoiceStatus::CANCELLED},
        };
        return transitions;
    }

    /**
     * @return строка таблицы или nullptr, если действие не меняет статус
     */
    static const Transition* find(InvoiceAction action) {
        for (const auto& t : table()) {
            if (t.action == action) {
                return &t;
            }
        }
        return nullptr;
    }

    /**
     * @brief Проверка предусловия по текущему статусу
     * @throws InvalidTransitionException если переход из current не определён
     */
    static const Transition& require(InvoiceAction action, InvoiceStatus current) {
        const Transition* t = find(action);
        if (!t || !t->permits(current)) {
            throw InvalidTransitionException(action, current);
        }
        return *t;
    }

    static bool isTerminal(InvoiceStatus status) {
        for (const auto& t : table()) {
            if (t.permits(status)) {
                return false;
            }
        }
        return true;
    }
};

} // namespace invoicing::domain
