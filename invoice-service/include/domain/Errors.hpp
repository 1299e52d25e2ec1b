#pragma once

#include "enums/InvoiceStatus.hpp"
#include "enums/InvoiceAction.hpp"
#include "enums/UserRole.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

/**
 * @file Errors.hpp
 * @brief Исключения предметной области
 *
 * Все ошибки ядра поднимаются к вызывающему как есть. code() возвращает стабильный
 * идентификатор для HTTP-слоя.
 */
namespace invoicing::domain {

class InvoicingException : public std::runtime_error {
public:
    InvoicingException(const std::string& code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

class InvalidTransitionException : public InvoicingException {
public:
    InvalidTransitionException(InvoiceAction action, InvoiceStatus current)
        : InvoicingException("invalid_transition",
              "Cannot " + toString(action) + " invoice in status " + toString(current))
        , action_(action), current_(current) {}

    InvoiceAction action() const { return action_; }
    InvoiceStatus current() const { return current_; }

private:
    InvoiceAction action_;
    InvoiceStatus current_;
};

struct StockShortfall {
    std::string productId;
    int64_t requested = 0;
    int64_t available = 0;

    int64_t shortfall() const { return requested - available; }
};

class InsufficientStockException : public InvoicingException {
public:
    explicit InsufficientStockException(std::vector<StockShortfall> shortfalls)
        : InvoicingException("insufficient_stock", describe(shortfalls))
        , shortfalls_(std::move(shortfalls)) {}

    const std::vector<StockShortfall>& shortfalls() const { return shortfalls_; }

private:
    std::vector<StockShortfall> shortfalls_;

    static std::string describe(const std::vector<StockShortfall>& shortfalls) {
        std::string msg = "Insufficient stock:";
        for (const auto& s : shortfalls) {
            msg += " " + s.productId + " (short by " + std::to_string(s.shortfall()) + ")";
        }
        return msg;
    }
};

class ForbiddenException : public InvoicingException {
public:
    explicit ForbiddenException(const std::string& message)
        : InvoicingException("forbidden", message) {}

    ForbiddenException(UserRole role, InvoiceAction action)
        : InvoicingException("forbidden",
              "Role " + toString(role) + " is not allowed to " + toString(action)) {}
};

class NotFoundException : public InvoicingException {
public:
    NotFoundException(const std::string& entity, const std::string& id)
        : InvoicingException("not_found", entity + " not found: " + id) {}
};

class ConflictException : public InvoicingException {
public:
    explicit ConflictException(const std::string& message)
        : InvoicingException("conflict", message) {}
};

class ValidationException : public InvoicingException {
public:
    explicit ValidationException(const std::string& message)
        : InvoicingException("validation_error", message) {}
};

} // namespace invoicing::domain
