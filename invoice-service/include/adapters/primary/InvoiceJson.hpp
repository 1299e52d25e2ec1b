#pragma once

#include "domain/InvoiceView.hpp"
#include "domain/InvoiceRequest.hpp"
#include "domain/InventoryTransaction.hpp"
#include "domain/TrackingInfo.hpp"
#include "domain/Errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <limits>
#include <optional>

namespace invoicing::adapters::primary
{

    /**
     * @brief JSON-представление счетов, журнала и тел запросов
     */
    class InvoiceJson
    {
    public:
        // ====================================================================
        // Ответы
        // ====================================================================

        static nlohmann::json toJson(const domain::InvoiceView &view)
        {
            const auto &invoice = view.invoice;

            nlohmann::json j;
            j["id"] = invoice.id;
            j["invoice_number"] = invoice.number;
            j["status"] = domain::toString(invoice.status);
            j["payment_type"] = domain::toString(invoice.paymentType);

            if (!invoice.paymentBreakdown.empty())
            {
                j["payment_breakdown"] = nlohmann::json::object();
                for (const auto &[method, amount] : invoice.paymentBreakdown)
                    j["payment_breakdown"][method] = amount.toDouble();
            }

            j["customer"] = toJson(view.customer);

            j["created_by"] = {
                {"id", view.creator.id},
                {"email", view.creator.email},
                {"full_name", view.creator.firstName + " " + view.creator.lastName},
                {"role", domain::toString(view.creator.role)}};

            j["items"] = nlohmann::json::array();
            for (const auto &resolved : view.items)
            {
                const auto &item = resolved.item;
                nlohmann::json line;
                line["product_id"] = item.productId;
                line["product_code"] = resolved.product.code;
                line["product_name"] = resolved.product.name;
                line["quantity"] = item.quantity;
                line["unit"] = item.unit;
                line["unit_price"] = item.unitPrice.toDouble();
                line["line_total"] = item.lineTotal().toDouble();
                if (item.rollsCount)
                    line["rolls_count"] = *item.rollsCount;
                if (item.piecesPerRoll)
                    line["pieces_per_roll"] = *item.piecesPerRoll;
                if (!item.detailedRolls.empty())
                {
                    line["detailed_rolls"] = nlohmann::json::array();
                    for (const auto &roll : item.detailedRolls)
                    {
                        nlohmann::json pieces = nlohmann::json::array();
                        for (auto measurement : roll.pieces)
                            pieces.push_back({{"measurement", measurement}});
                        line["detailed_rolls"].push_back({{"pieces", pieces}});
                    }
                }
                j["items"].push_back(line);
            }

            auto subtotal = invoice.subtotal();
            j["subtotal"] = subtotal.toDouble();
            j["total"] = invoice.total().toDouble();
            j["currency"] = subtotal.currency;
            j["total_quantity"] = invoice.totalQuantity();

            if (invoice.tracking)
                j["tracking_info"] = toJson(*invoice.tracking);
            else
                j["tracking_info"] = nullptr;

            j["created_at"] = invoice.createdAt.toString();
            j["updated_at"] = invoice.updatedAt.toString();
            return j;
        }

        static nlohmann::json toJson(const domain::Customer &customer)
        {
            nlohmann::json j;
            j["id"] = customer.id;
            j["full_name"] = customer.fullName();
            j["phone"] = customer.phone;
            j["city"] = customer.city;
            j["bank_accounts"] = nlohmann::json::array();
            for (const auto &account : customer.bankAccounts)
            {
                j["bank_accounts"].push_back({{"bank_name", account.bankName},
                                              {"account_number", account.accountNumber},
                                              {"iban", account.iban}});
            }
            return j;
        }

        static nlohmann::json toJson(const domain::TrackingInfo &tracking)
        {
            return {
                {"carrier_name", tracking.carrierName},
                {"tracking_code", tracking.trackingCode},
                {"shipping_date", tracking.shippingDate},
                {"number_of_packages", tracking.numberOfPackages}};
        }

        static nlohmann::json toJson(const domain::InventoryTransaction &txn)
        {
            nlohmann::json j;
            j["id"] = txn.id;
            j["product_id"] = txn.productId;
            j["invoice_id"] = txn.invoiceId.empty() ? nlohmann::json(nullptr) : nlohmann::json(txn.invoiceId);
            j["transaction_type"] = domain::toString(txn.kind);
            j["quantity_change"] = txn.delta;
            j["created_by"] = txn.createdBy;
            j["notes"] = txn.notes;
            j["created_at"] = txn.createdAt.toString();
            return j;
        }

        static nlohmann::json toJson(const domain::ProductStock &stock)
        {
            return {
                {"product_id", stock.productId},
                {"name", stock.name},
                {"quantity_available", stock.quantityAvailable},
                {"reserved_quantity", stock.reservedQuantity}};
        }

        // ====================================================================
        // Запросы
        // ====================================================================

        /**
         * @throws nlohmann::json::exception при неверных типах полей
         * @throws std::invalid_argument при неизвестном payment_type
         * @throws domain::ValidationException если количество не целое
         */
        static domain::CreateInvoiceRequest parseCreateInvoice(const nlohmann::json &body)
        {
            domain::CreateInvoiceRequest request;
            request.customerId = body.value("customer_id", "");
            request.paymentType = domain::parsePaymentType(body.value("payment_type", "cash"));

            if (body.contains("payment_breakdown") && !body["payment_breakdown"].is_null())
            {
                for (auto it = body["payment_breakdown"].begin(); it != body["payment_breakdown"].end(); ++it)
                    request.paymentBreakdown[it.key()] = domain::Money::fromDouble(it.value().get<double>());
            }

            for (const auto &line : body.value("items", nlohmann::json::array()))
            {
                domain::InvoiceItemRequest item;
                item.productId = line.value("product_id", "");
                item.quantity = integerField(line, "quantity").value_or(0);
                item.unit = line.value("unit", "");
                item.unitPrice = domain::Money::fromDouble(
                    line.value("unit_price", 0.0),
                    line.value("currency", "IRR"));
                item.rollsCount = integerField(line, "rolls_count");
                item.piecesPerRoll = integerField(line, "pieces_per_roll");
                if (line.contains("detailed_rolls") && !line["detailed_rolls"].is_null())
                {
                    for (const auto &r : line["detailed_rolls"])
                    {
                        domain::RollDetail roll;
                        for (const auto &piece : r.value("pieces", nlohmann::json::array()))
                            roll.pieces.push_back(integerField(piece, "measurement").value_or(0));
                        item.detailedRolls.push_back(std::move(roll));
                    }
                }
                request.items.push_back(item);
            }
            return request;
        }

        static domain::TrackingInfo parseTracking(const nlohmann::json &body)
        {
            domain::TrackingInfo tracking;
            tracking.carrierName = body.value("carrier_name", "");
            tracking.trackingCode = body.value("tracking_code", "");
            tracking.shippingDate = body.value("shipping_date", "");
            tracking.numberOfPackages = integerField(body, "number_of_packages").value_or(0);
            return tracking;
        }

        static domain::StockAdjustmentRequest parseAdjustment(const nlohmann::json &body)
        {
            domain::StockAdjustmentRequest request;
            request.productId = body.value("product_id", "");
            request.delta = integerField(body, "quantity_change").value_or(0);
            request.notes = body.value("notes", "");
            return request;
        }

    private:
        /**
         * @brief Целое поле в базовых единицах; дробные значения не усекаются, а отклоняются
         */
        static std::optional<int64_t> integerField(const nlohmann::json &body, const char *key)
        {
            if (!body.contains(key) || body[key].is_null())
                return std::nullopt;

            const auto &value = body[key];
            if (!value.is_number_integer())
                throw domain::ValidationException(std::string(key) + " must be an integer");
            if (value.is_number_unsigned() &&
                value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
                throw domain::ValidationException(std::string(key) + " is out of range");
            return value.get<int64_t>();
        }
    };

} // namespace invoicing::adapters::primary
