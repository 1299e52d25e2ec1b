#pragma once

#include "ports/input/IInvoiceService.hpp"
#include "ports/output/IInvoiceStore.hpp"
#include "ports/output/IProductRepository.hpp"
#include "ports/output/IDirectory.hpp"
#include "application/UnitOfWorkRunner.hpp"
#include "application/ReservationCoordinator.hpp"
#include "application/CompensationEngine.hpp"
#include "application/InvoiceAssembler.hpp"
#include "settings/LockSettings.hpp"
#include "domain/AccessPolicy.hpp"
#include "domain/InvoiceStateMachine.hpp"
#include "domain/Errors.hpp"
#include "utils/IdGenerator.hpp"
#include <memory>
#include <optional>
#include <limits>
#include <iostream>

namespace invoicing::application {

/**
 * @brief Сервис жизненного цикла счёта
 *
 * Переход выполняется так:
 * 1. счёт загружается, текущий статус сверяется с таблицей переходов
 *    (InvalidTransitionException);
 * 2. Authorization Gate (ForbiddenException);
 * 3. проверка входных данных (ValidationException) до любых записей;
 * 4. в единице работы: блокировка счёта и товаров, повторная сверка
 *    статуса (ConflictException), побочный эффект, запись статуса, commit.
 */
class InvoiceService : public ports::input::IInvoiceService {
public:
    InvoiceService(
        std::shared_ptr<ports::output::IInvoiceStore> store,
        std::shared_ptr<ports::output::IProductRepository> products,
        std::shared_ptr<ports::output::ICustomerRepository> customers,
        std::shared_ptr<ports::output::IUserRepository> users,
        std::shared_ptr<settings::LockSettings> lockSettings
    ) : store_(store)
      , products_(products)
      , customers_(customers)
      , runner_(store, std::move(lockSettings))
      , assembler_(std::move(products), std::move(customers), std::move(users))
    {
        std::cout << "[InvoiceService] Created" << std::endl;
    }

    domain::InvoiceView createInvoice(
        const domain::Actor& actor,
        const domain::CreateInvoiceRequest& request) override
    {
        if (!domain::AccessPolicy::isAllowed(actor.role, domain::InvoiceAction::CREATE)) {
            throw domain::ForbiddenException(actor.role, domain::InvoiceAction::CREATE);
        }
        if (request.customerId.empty()) {
            throw domain::ValidationException("customer_id is required");
        }
        if (request.items.empty()) {
            throw domain::ValidationException("Invoice must contain at least one item");
        }
        if (!customers_->findById(request.customerId)) {
            throw domain::NotFoundException("Customer", request.customerId);
        }
        validatePayment(request);

        std::vector<domain::InvoiceItem> items;
        items.reserve(request.items.size());
        for (const auto& itemRequest : request.items) {
            auto product = products_->findById(itemRequest.productId);
            if (!product) {
                throw domain::NotFoundException("Product", itemRequest.productId);
            }

            domain::InvoiceItem item;
            item.productId = product->id;
            item.quantity = effectiveQuantity(itemRequest, *product);
            if (!product->isAvailable) {
                throw domain::ValidationException("Product " + product->name + " is currently unavailable");
            }
            item.unit = itemRequest.unit.empty() ? product->unit : itemRequest.unit;
            item.unitPrice = itemRequest.unitPrice;
            item.rollsCount = itemRequest.rollsCount;
            item.piecesPerRoll = itemRequest.piecesPerRoll;
            item.detailedRolls = itemRequest.detailedRolls;

            if (item.unitPrice.isNegative()) {
                throw domain::ValidationException("Price for " + product->name + " cannot be negative");
            }
            items.push_back(std::move(item));
        }

        domain::Invoice invoice(std::move(items));
        invoice.id = utils::IdGenerator::invoiceId();
        invoice.customerId = request.customerId;
        invoice.createdBy = actor.userId;
        invoice.status = domain::InvoiceStatus::WAREHOUSE_PENDING;
        invoice.paymentType = request.paymentType;
        invoice.paymentBreakdown = request.paymentBreakdown;
        invoice.createdAt = domain::Timestamp::now();
        invoice.updatedAt = invoice.createdAt;

        auto saved = store_->insert(invoice);
        std::cout << "[InvoiceService] Created " << saved.number << " (" << saved.id
                  << ") by " << actor.userId << std::endl;
        return assembler_.assemble(saved);
    }

    domain::InvoiceView reserve(const domain::Actor& actor, const std::string& invoiceId) override {
        return runTransition(actor, invoiceId, domain::InvoiceAction::RESERVE, std::nullopt);
    }

    domain::InvoiceView approve(const domain::Actor& actor, const std::string& invoiceId) override {
        return runTransition(actor, invoiceId, domain::InvoiceAction::APPROVE, std::nullopt);
    }

    domain::InvoiceView ship(
        const domain::Actor& actor,
        const std::string& invoiceId,
        const domain::TrackingInfo& tracking) override
    {
        return runTransition(actor, invoiceId, domain::InvoiceAction::SHIP, tracking);
    }

    domain::InvoiceView deliver(const domain::Actor& actor, const std::string& invoiceId) override {
        return runTransition(actor, invoiceId, domain::InvoiceAction::DELIVER, std::nullopt);
    }

    domain::InvoiceView cancel(const domain::Actor& actor, const std::string& invoiceId) override {
        return runTransition(actor, invoiceId, domain::InvoiceAction::CANCEL, std::nullopt);
    }

    domain::InvoiceView getInvoice(const domain::Actor& actor, const std::string& invoiceId) override {
        auto invoice = store_->findById(invoiceId);
        if (!invoice) {
            throw domain::NotFoundException("Invoice", invoiceId);
        }
        if (!domain::AccessPolicy::canView(actor.role, invoice->status)) {
            throw domain::ForbiddenException(
                "Role " + domain::toString(actor.role) + " cannot view invoices in status "
                + domain::toString(invoice->status));
        }
        return assembler_.assemble(*invoice);
    }

    domain::InvoiceViewPage listInvoices(
        const domain::Actor& actor,
        const domain::InvoiceFilter& filter) override
    {
        if (filter.skip < 0) {
            throw domain::ValidationException("skip must not be negative");
        }
        if (filter.limit <= 0 || filter.limit > domain::InvoiceFilter::MAX_LIMIT) {
            throw domain::ValidationException(
                "limit must be between 1 and " + std::to_string(domain::InvoiceFilter::MAX_LIMIT));
        }

        domain::InvoiceFilter scoped = filter;
        scoped.visibleStatuses = domain::AccessPolicy::visibleStatuses(actor.role);

        auto page = store_->find(scoped);

        domain::InvoiceViewPage result;
        result.items = assembler_.assembleAll(page.items);
        result.total = page.total;
        result.skip = scoped.skip;
        result.limit = scoped.limit;
        return result;
    }

private:
    std::shared_ptr<ports::output::IInvoiceStore> store_;
    std::shared_ptr<ports::output::IProductRepository> products_;
    std::shared_ptr<ports::output::ICustomerRepository> customers_;
    UnitOfWorkRunner runner_;
    InvoiceAssembler assembler_;
    ReservationCoordinator reservations_;
    CompensationEngine compensation_;

    domain::InvoiceView runTransition(
        const domain::Actor& actor,
        const std::string& invoiceId,
        domain::InvoiceAction action,
        const std::optional<domain::TrackingInfo>& tracking)
    {
        auto snapshot = store_->findById(invoiceId);
        if (!snapshot) {
            throw domain::NotFoundException("Invoice", invoiceId);
        }

        const auto& transition = domain::InvoiceStateMachine::require(action, snapshot->status);

        if (!domain::AccessPolicy::isAllowed(actor.role, action, snapshot->status)) {
            throw domain::ForbiddenException(actor.role, action);
        }

        if (transition.effect == domain::SideEffect::MARK_SHIPPED) {
            validateTracking(tracking);
        }

        const domain::InvoiceStatus expected = snapshot->status;
        ports::output::LockSet locks{invoiceId, snapshot->productIds()};

        auto updated = runner_.run(locks, [&](ports::output::IUnitOfWork& uow) {
            auto current = uow.findInvoice(invoiceId);
            if (!current) {
                throw domain::NotFoundException("Invoice", invoiceId);
            }
            if (current->status != expected) {
                throw domain::ConflictException(
                    "Invoice " + current->number + " changed to " + domain::toString(current->status)
                    + " concurrently, refetch and retry");
            }

            applySideEffect(uow, transition.effect, *current, actor);

            current->transitionTo(transition.target);
            if (transition.effect == domain::SideEffect::MARK_SHIPPED) {
                current->tracking = tracking;
            }

            if (!uow.updateInvoice(*current, expected)) {
                throw domain::ConflictException(
                    "Invoice " + current->number + " was modified concurrently, refetch and retry");
            }
            uow.commit();
            return *current;
        });

        std::cout << "[InvoiceService] " << updated.number << ": " << domain::toString(expected)
                  << " -> " << domain::toString(updated.status) << " by " << actor.userId
                  << " (" << domain::toString(actor.role) << ")" << std::endl;

        return assembler_.assemble(updated);
    }

    void applySideEffect(
        ports::output::IUnitOfWork& uow,
        domain::SideEffect effect,
        const domain::Invoice& invoice,
        const domain::Actor& actor)
    {
        switch (effect) {
            case domain::SideEffect::RESERVE_STOCK:
                reservations_.reserve(uow, invoice, actor);
                break;
            case domain::SideEffect::MARK_SHIPPED:
                markShipped(uow, invoice, actor);
                break;
            case domain::SideEffect::RELEASE_STOCK:
                compensation_.release(uow, invoice, actor);
                break;
            case domain::SideEffect::NONE:
                break;
        }
    }

    /**
     * @brief ship-mark по строкам: только аудит, остаток уже списан резервом
     */
    void markShipped(ports::output::IUnitOfWork& uow, const domain::Invoice& invoice, const domain::Actor& actor) {
        for (const auto& item : invoice.items()) {
            domain::InventoryTransaction txn;
            txn.id = utils::IdGenerator::transactionId();
            txn.productId = item.productId;
            txn.invoiceId = invoice.id;
            txn.kind = domain::TransactionKind::SHIP_MARK;
            txn.delta = 0;
            txn.createdBy = actor.userId;
            txn.notes = "Shipped with invoice " + invoice.number;
            txn.createdAt = domain::Timestamp::now();
            uow.appendTransaction(txn);
        }
    }

    static void validateTracking(const std::optional<domain::TrackingInfo>& tracking) {
        if (!tracking) {
            throw domain::ValidationException("Tracking info is required");
        }
        if (tracking->carrierName.empty()) {
            throw domain::ValidationException("carrier_name is required");
        }
        if (tracking->trackingCode.empty()) {
            throw domain::ValidationException("tracking_code is required");
        }
        if (tracking->shippingDate.empty()) {
            throw domain::ValidationException("shipping_date is required");
        }
        if (tracking->numberOfPackages <= 0) {
            throw domain::ValidationException("number_of_packages must be positive");
        }
    }

    static void validatePayment(const domain::CreateInvoiceRequest& request) {
        if (request.paymentType != domain::PaymentType::MIXED) {
            if (!request.paymentBreakdown.empty()) {
                throw domain::ValidationException("payment_breakdown is only allowed for mixed payment");
            }
            return;
        }

        if (request.paymentBreakdown.empty()) {
            throw domain::ValidationException("Mixed payment requires payment_breakdown");
        }
        for (const auto& [method, amount] : request.paymentBreakdown) {
            if (method != "cash" && method != "check") {
                throw domain::ValidationException("Unknown payment method in breakdown: " + method);
            }
            if (amount.isNegative() || (amount.units == 0 && amount.nano == 0)) {
                throw domain::ValidationException("Breakdown amount for " + method + " must be positive");
            }
        }
    }

    /**
     * @brief Количество строки
     *
     * detailedRolls: сумма замеров всех кусков; иначе rollsCount × piecesPerRoll;
     * иначе quantity. Все множители и замеры строго положительны.
     */
    static int64_t effectiveQuantity(const domain::InvoiceItemRequest& request, const domain::Product& product) {
        constexpr int64_t maxQuantity = std::numeric_limits<int64_t>::max();

        int64_t quantity = request.quantity;
        if (!request.detailedRolls.empty()) {
            quantity = 0;
            for (const auto& roll : request.detailedRolls) {
                for (auto measurement : roll.pieces) {
                    if (measurement <= 0) {
                        throw domain::ValidationException(
                            "Piece measurement for " + product.name + " must be positive");
                    }
                    if (measurement > maxQuantity - quantity) {
                        throw domain::ValidationException("Quantity for " + product.name + " is too large");
                    }
                    quantity += measurement;
                }
            }
        } else if (request.rollsCount) {
            if (!request.piecesPerRoll) {
                throw domain::ValidationException(
                    "pieces_per_roll is required when rolls_count is given for " + product.name);
            }
            int64_t rolls = *request.rollsCount;
            int64_t pieces = *request.piecesPerRoll;
            if (rolls <= 0 || pieces <= 0) {
                throw domain::ValidationException(
                    "rolls_count and pieces_per_roll for " + product.name + " must be positive");
            }
            if (rolls > maxQuantity / pieces) {
                throw domain::ValidationException("Quantity for " + product.name + " is too large");
            }
            quantity = rolls * pieces;
        }
        if (quantity <= 0) {
            throw domain::ValidationException("Quantity for " + product.name + " must be positive");
        }
        return quantity;
    }
};

} // namespace invoicing::application
