#pragma once

#include "ports/output/IInvoiceStore.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LockSettings.hpp"
#include "domain/Errors.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <map>
#include <set>

namespace invoicing::adapters::secondary
{

    /**
     * @brief Преобразование строк PostgreSQL в доменные объекты и обратно
     */
    class PostgresInvoiceRows
    {
    public:
        static constexpr const char *INVOICE_COLUMNS =
            "id, number, customer_id, created_by, status, payment_type, "
            "payment_breakdown::text AS payment_breakdown, tracking_info::text AS tracking_info, "
            "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS') AS created_at, "
            "to_char(updated_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS') AS updated_at";

        static constexpr const char *TRANSACTION_COLUMNS =
            "id, product_id, invoice_id, kind, delta, created_by, notes, "
            "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS') AS created_at";

        /**
         * @brief Загрузить строки для набора счетов одним запросом
         */
        static std::map<std::string, std::vector<domain::InvoiceItem>> loadItems(
            pqxx::transaction_base &txn,
            const std::vector<std::string> &invoiceIds)
        {
            std::map<std::string, std::vector<domain::InvoiceItem>> items;
            if (invoiceIds.empty())
                return items;

            std::string ids;
            for (const auto &id : invoiceIds)
            {
                if (!ids.empty())
                    ids += ", ";
                ids += txn.quote(id);
            }

            auto result = txn.exec(
                "SELECT invoice_id, product_id, quantity, unit, unit_price_units, unit_price_nano, "
                "currency, rolls_count, pieces_per_roll, detailed_rolls::text AS detailed_rolls FROM invoice_items "
                "WHERE invoice_id IN (" + ids + ") ORDER BY invoice_id, position");

            for (const auto &row : result)
            {
                domain::InvoiceItem item;
                item.productId = row["product_id"].as<std::string>();
                item.quantity = row["quantity"].as<int64_t>();
                item.unit = row["unit"].as<std::string>();
                item.unitPrice = domain::Money(
                    row["unit_price_units"].as<int64_t>(),
                    row["unit_price_nano"].as<int32_t>(),
                    row["currency"].as<std::string>());
                if (!row["rolls_count"].is_null())
                    item.rollsCount = row["rolls_count"].as<int64_t>();
                if (!row["pieces_per_roll"].is_null())
                    item.piecesPerRoll = row["pieces_per_roll"].as<int64_t>();
                if (!row["detailed_rolls"].is_null())
                    item.detailedRolls = rollsFromJson(row["detailed_rolls"].as<std::string>());
                items[row["invoice_id"].as<std::string>()].push_back(std::move(item));
            }
            return items;
        }

        static domain::Invoice toInvoice(const pqxx::row &row, std::vector<domain::InvoiceItem> items)
        {
            domain::Invoice invoice(std::move(items));
            invoice.id = row["id"].as<std::string>();
            invoice.number = row["number"].as<std::string>();
            invoice.customerId = row["customer_id"].as<std::string>();
            invoice.createdBy = row["created_by"].as<std::string>();
            invoice.status = domain::parseInvoiceStatus(row["status"].as<std::string>());
            invoice.paymentType = domain::parsePaymentType(row["payment_type"].as<std::string>());
            if (!row["payment_breakdown"].is_null())
                invoice.paymentBreakdown = breakdownFromJson(row["payment_breakdown"].as<std::string>());
            if (!row["tracking_info"].is_null())
                invoice.tracking = trackingFromJson(row["tracking_info"].as<std::string>());
            invoice.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
            invoice.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
            return invoice;
        }

        static std::optional<domain::Invoice> loadInvoice(pqxx::transaction_base &txn, const std::string &invoiceId)
        {
            auto result = txn.exec_params(
                std::string("SELECT ") + INVOICE_COLUMNS + " FROM invoices WHERE id = $1", invoiceId);
            if (result.empty())
                return std::nullopt;

            auto items = loadItems(txn, {invoiceId});
            return toInvoice(result[0], std::move(items[invoiceId]));
        }

        static domain::InventoryTransaction toTransaction(const pqxx::row &row)
        {
            domain::InventoryTransaction t;
            t.id = row["id"].as<std::string>();
            t.productId = row["product_id"].as<std::string>();
            t.invoiceId = row["invoice_id"].is_null() ? "" : row["invoice_id"].as<std::string>();
            t.kind = domain::parseTransactionKind(row["kind"].as<std::string>());
            t.delta = row["delta"].as<int64_t>();
            t.createdBy = row["created_by"].as<std::string>();
            t.notes = row["notes"].as<std::string>();
            t.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
            return t;
        }

        static std::string breakdownToJson(const std::map<std::string, domain::Money> &breakdown)
        {
            nlohmann::json j = nlohmann::json::object();
            for (const auto &[method, amount] : breakdown)
            {
                j[method] = {{"units", amount.units}, {"nano", amount.nano}, {"currency", amount.currency}};
            }
            return j.dump();
        }

        static std::map<std::string, domain::Money> breakdownFromJson(const std::string &text)
        {
            std::map<std::string, domain::Money> breakdown;
            auto j = nlohmann::json::parse(text);
            for (auto it = j.begin(); it != j.end(); ++it)
            {
                breakdown[it.key()] = domain::Money(
                    it.value().value("units", int64_t{0}),
                    it.value().value("nano", int32_t{0}),
                    it.value().value("currency", std::string("IRR")));
            }
            return breakdown;
        }

        static std::string rollsToJson(const std::vector<domain::RollDetail> &rolls)
        {
            nlohmann::json j = nlohmann::json::array();
            for (const auto &roll : rolls)
            {
                nlohmann::json pieces = nlohmann::json::array();
                for (auto measurement : roll.pieces)
                    pieces.push_back({{"measurement", measurement}});
                j.push_back({{"pieces", pieces}});
            }
            return j.dump();
        }

        static std::vector<domain::RollDetail> rollsFromJson(const std::string &text)
        {
            std::vector<domain::RollDetail> rolls;
            for (const auto &r : nlohmann::json::parse(text))
            {
                domain::RollDetail roll;
                for (const auto &piece : r.value("pieces", nlohmann::json::array()))
                    roll.pieces.push_back(piece.value("measurement", int64_t{0}));
                rolls.push_back(std::move(roll));
            }
            return rolls;
        }

        static std::string trackingToJson(const domain::TrackingInfo &tracking)
        {
            nlohmann::json j;
            j["carrier_name"] = tracking.carrierName;
            j["tracking_code"] = tracking.trackingCode;
            j["shipping_date"] = tracking.shippingDate;
            j["number_of_packages"] = tracking.numberOfPackages;
            return j.dump();
        }

        static domain::TrackingInfo trackingFromJson(const std::string &text)
        {
            auto j = nlohmann::json::parse(text);
            domain::TrackingInfo tracking;
            tracking.carrierName = j.value("carrier_name", "");
            tracking.trackingCode = j.value("tracking_code", "");
            tracking.shippingDate = j.value("shipping_date", "");
            tracking.numberOfPackages = j.value("number_of_packages", int64_t{0});
            return tracking;
        }
    };

    /**
     * @brief PostgreSQL хранилище счетов и журнала склада
     *
     * Соединение на операцию. Единица работы держит свою транзакцию:
     * SELECT ... FOR UPDATE по счёту, затем по товарам в порядке id,
     * с SET LOCAL lock_timeout из LockSettings.
     */
    class PostgresInvoiceStore : public ports::output::IInvoiceStore
    {
    public:
        PostgresInvoiceStore(
            std::shared_ptr<settings::DbSettings> dbSettings,
            std::shared_ptr<settings::LockSettings> lockSettings) : dbSettings_(std::move(dbSettings)), lockSettings_(std::move(lockSettings))
        {
            // Проверяем соединение, схему создаёт sql/init.sql
            pqxx::connection c(dbSettings_->getConnectionString());
            std::cout << "[PostgresInvoiceStore] Connected to " << dbSettings_->getName() << std::endl;
        }

        std::unique_ptr<ports::output::IUnitOfWork> begin(const ports::output::LockSet &locks) override
        {
            return guarded([&]() -> std::unique_ptr<ports::output::IUnitOfWork>
                           {
                auto uow = std::make_unique<UnitOfWork>(dbSettings_->getConnectionString());
                uow->lock(locks, lockSettings_->getLockTimeout().count());
                return uow; });
        }

        domain::Invoice insert(const domain::Invoice &invoice) override
        {
            pqxx::connection c(dbSettings_->getConnectionString());
            pqxx::work t(c);

            domain::Invoice saved = invoice;
            int year = domain::Invoice::numberingYear(saved.createdAt);
            auto counter = t.exec_params(
                "INSERT INTO invoice_counters (year, last_number) VALUES ($1, 1) "
                "ON CONFLICT (year) DO UPDATE SET last_number = invoice_counters.last_number + 1 "
                "RETURNING last_number",
                year);
            saved.number = domain::Invoice::formatNumber(year, counter[0][0].as<int64_t>());

            std::optional<std::string> breakdown;
            if (!saved.paymentBreakdown.empty())
                breakdown = PostgresInvoiceRows::breakdownToJson(saved.paymentBreakdown);

            t.exec_params(
                "INSERT INTO invoices (id, number, customer_id, created_by, status, payment_type, "
                "payment_breakdown, created_at, updated_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, $7::jsonb, $8::timestamptz, $9::timestamptz)",
                saved.id,
                saved.number,
                saved.customerId,
                saved.createdBy,
                domain::toString(saved.status),
                domain::toString(saved.paymentType),
                breakdown,
                saved.createdAt.toString(),
                saved.updatedAt.toString());

            int position = 0;
            for (const auto &item : saved.items())
            {
                std::optional<std::string> rolls;
                if (!item.detailedRolls.empty())
                    rolls = PostgresInvoiceRows::rollsToJson(item.detailedRolls);

                t.exec_params(
                    "INSERT INTO invoice_items (invoice_id, position, product_id, quantity, unit, "
                    "unit_price_units, unit_price_nano, currency, rolls_count, pieces_per_roll, detailed_rolls) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11::jsonb)",
                    saved.id,
                    position++,
                    item.productId,
                    item.quantity,
                    item.unit,
                    item.unitPrice.units,
                    item.unitPrice.nano,
                    item.unitPrice.currency,
                    item.rollsCount,
                    item.piecesPerRoll,
                    rolls);
            }

            t.commit();
            std::cout << "[PostgresInvoiceStore] Inserted " << saved.number << std::endl;
            return saved;
        }

        std::optional<domain::Invoice> findById(const std::string &invoiceId) override
        {
            pqxx::connection c(dbSettings_->getConnectionString());
            pqxx::work t(c);
            return PostgresInvoiceRows::loadInvoice(t, invoiceId);
        }

        domain::InvoicePage find(const domain::InvoiceFilter &filter) override
        {
            pqxx::connection c(dbSettings_->getConnectionString());
            pqxx::work t(c);

            std::string where = whereClause(t, filter);

            domain::InvoicePage page;
            page.total = t.exec("SELECT COUNT(*) FROM invoices" + where)[0][0].as<int64_t>();

            auto rows = t.exec(
                std::string("SELECT ") + PostgresInvoiceRows::INVOICE_COLUMNS + " FROM invoices" + where +
                " ORDER BY invoices.created_at DESC, number DESC" +
                " LIMIT " + std::to_string(filter.limit) + " OFFSET " + std::to_string(filter.skip));

            std::vector<std::string> ids;
            for (const auto &row : rows)
                ids.push_back(row["id"].as<std::string>());

            auto items = PostgresInvoiceRows::loadItems(t, ids);
            for (const auto &row : rows)
            {
                auto id = row["id"].as<std::string>();
                page.items.push_back(PostgresInvoiceRows::toInvoice(row, std::move(items[id])));
            }
            return page;
        }

        std::vector<domain::InventoryTransaction> findTransactions(const domain::TransactionFilter &filter) override
        {
            pqxx::connection c(dbSettings_->getConnectionString());
            pqxx::work t(c);

            std::vector<std::string> conditions;
            if (filter.productId)
                conditions.push_back("product_id = " + t.quote(*filter.productId));
            if (filter.invoiceId)
                conditions.push_back("invoice_id = " + t.quote(*filter.invoiceId));
            if (filter.kind)
                conditions.push_back("kind = " + t.quote(domain::toString(*filter.kind)));

            auto rows = t.exec(
                std::string("SELECT ") + PostgresInvoiceRows::TRANSACTION_COLUMNS +
                " FROM inventory_transactions" + join(conditions) +
                " ORDER BY seq DESC LIMIT " + std::to_string(filter.limit) +
                " OFFSET " + std::to_string(filter.skip));

            std::vector<domain::InventoryTransaction> result;
            for (const auto &row : rows)
                result.push_back(PostgresInvoiceRows::toTransaction(row));
            return result;
        }

        std::vector<domain::InventoryTransaction> transactionsForProduct(const std::string &productId) override
        {
            pqxx::connection c(dbSettings_->getConnectionString());
            pqxx::work t(c);
            auto rows = t.exec_params(
                std::string("SELECT ") + PostgresInvoiceRows::TRANSACTION_COLUMNS +
                    " FROM inventory_transactions WHERE product_id = $1 ORDER BY seq",
                productId);

            std::vector<domain::InventoryTransaction> result;
            for (const auto &row : rows)
                result.push_back(PostgresInvoiceRows::toTransaction(row));
            return result;
        }

    private:
        std::shared_ptr<settings::DbSettings> dbSettings_;
        std::shared_ptr<settings::LockSettings> lockSettings_;

        /**
         * @brief Ошибки конкуренции сервера превращаются в LockContentionException
         *
         * 55P03 (lock_not_available) приходит по lock_timeout.
         */
        template <typename Fn>
        static auto guarded(Fn &&fn) -> decltype(fn())
        {
            try
            {
                return fn();
            }
            catch (const pqxx::deadlock_detected &e)
            {
                throw ports::output::LockContentionException(std::string("deadlock: ") + e.what());
            }
            catch (const pqxx::serialization_failure &e)
            {
                throw ports::output::LockContentionException(std::string("serialization: ") + e.what());
            }
            catch (const pqxx::sql_error &e)
            {
                if (e.sqlstate() == "55P03")
                    throw ports::output::LockContentionException(std::string("lock timeout: ") + e.what());
                throw;
            }
        }

        class UnitOfWork : public ports::output::IUnitOfWork
        {
        public:
            explicit UnitOfWork(const std::string &connectionString)
                : connection_(std::make_unique<pqxx::connection>(connectionString)), txn_(std::make_unique<pqxx::work>(*connection_))
            {
            }

            // незакоммиченная pqxx::work откатывается в своём деструкторе
            ~UnitOfWork() override = default;

            void lock(const ports::output::LockSet &locks, long long timeoutMs)
            {
                txn_->exec("SET LOCAL lock_timeout = '" + std::to_string(timeoutMs) + "ms'");

                if (!locks.invoiceId.empty())
                {
                    txn_->exec_params("SELECT id FROM invoices WHERE id = $1 FOR UPDATE", locks.invoiceId);
                }

                std::set<std::string> productIds(locks.productIds.begin(), locks.productIds.end());
                for (const auto &id : productIds)
                {
                    txn_->exec_params("SELECT id FROM products WHERE id = $1 FOR UPDATE", id);
                }
            }

            std::optional<domain::Invoice> findInvoice(const std::string &invoiceId) override
            {
                return guarded([&]
                               { return PostgresInvoiceRows::loadInvoice(*txn_, invoiceId); });
            }

            std::optional<domain::Product> findProduct(const std::string &productId) override
            {
                return guarded([&]() -> std::optional<domain::Product>
                               {
                    auto r = txn_->exec_params(
                        "SELECT id, code, name, unit, quantity_available, is_available FROM products WHERE id = $1", productId);
                    if (r.empty())
                        return std::nullopt;
                    domain::Product p;
                    p.id = r[0]["id"].as<std::string>();
                    p.code = r[0]["code"].as<std::string>();
                    p.name = r[0]["name"].as<std::string>();
                    p.unit = r[0]["unit"].as<std::string>();
                    p.quantityAvailable = r[0]["quantity_available"].as<int64_t>();
                    p.isAvailable = r[0]["is_available"].as<bool>();
                    return p; });
            }

            std::vector<domain::InventoryTransaction> transactionsForInvoice(const std::string &invoiceId) override
            {
                return guarded([&]
                               {
                    auto rows = txn_->exec_params(
                        std::string("SELECT ") + PostgresInvoiceRows::TRANSACTION_COLUMNS +
                            " FROM inventory_transactions WHERE invoice_id = $1 ORDER BY seq",
                        invoiceId);
                    std::vector<domain::InventoryTransaction> result;
                    for (const auto &row : rows)
                        result.push_back(PostgresInvoiceRows::toTransaction(row));
                    return result; });
            }

            void appendTransaction(const domain::InventoryTransaction &entry) override
            {
                guarded([&]
                        {
                    auto product = findProduct(entry.productId);
                    if (!product)
                        throw domain::NotFoundException("Product", entry.productId);
                    if (product->quantityAvailable + entry.delta < 0)
                    {
                        throw domain::InsufficientStockException(std::vector<domain::StockShortfall>{
                            {entry.productId, -entry.delta, product->quantityAvailable}});
                    }

                    txn_->exec_params(
                        "UPDATE products SET quantity_available = quantity_available + $2 WHERE id = $1",
                        entry.productId, entry.delta);

                    std::optional<std::string> invoiceId;
                    if (!entry.invoiceId.empty())
                        invoiceId = entry.invoiceId;

                    txn_->exec_params(
                        "INSERT INTO inventory_transactions (id, product_id, invoice_id, kind, delta, created_by, notes, created_at) "
                        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8::timestamptz)",
                        entry.id,
                        entry.productId,
                        invoiceId,
                        domain::toString(entry.kind),
                        entry.delta,
                        entry.createdBy,
                        entry.notes,
                        entry.createdAt.toString()); });
            }

            bool updateInvoice(const domain::Invoice &invoice, domain::InvoiceStatus expected) override
            {
                return guarded([&]
                               {
                    std::optional<std::string> tracking;
                    if (invoice.tracking)
                        tracking = PostgresInvoiceRows::trackingToJson(*invoice.tracking);

                    auto r = txn_->exec_params(
                        "UPDATE invoices SET status = $2, tracking_info = $3::jsonb, updated_at = $4::timestamptz "
                        "WHERE id = $1 AND status = $5",
                        invoice.id,
                        domain::toString(invoice.status),
                        tracking,
                        invoice.updatedAt.toString(),
                        domain::toString(expected));
                    return r.affected_rows() == 1; });
            }

            void commit() override
            {
                guarded([&]
                        { txn_->commit(); });
            }

        private:
            std::unique_ptr<pqxx::connection> connection_;
            std::unique_ptr<pqxx::work> txn_;
        };

        static std::string join(const std::vector<std::string> &conditions)
        {
            std::string where;
            for (const auto &c : conditions)
            {
                where += where.empty() ? " WHERE " : " AND ";
                where += c;
            }
            return where;
        }

        static std::string whereClause(pqxx::transaction_base &t, const domain::InvoiceFilter &filter)
        {
            std::vector<std::string> conditions;
            if (filter.visibleStatuses)
            {
                if (filter.visibleStatuses->empty())
                {
                    conditions.push_back("FALSE");
                }
                else
                {
                    std::string list;
                    for (auto status : *filter.visibleStatuses)
                    {
                        if (!list.empty())
                            list += ", ";
                        list += t.quote(domain::toString(status));
                    }
                    conditions.push_back("status IN (" + list + ")");
                }
            }
            if (filter.status)
                conditions.push_back("status = " + t.quote(domain::toString(*filter.status)));
            if (filter.customerId)
                conditions.push_back("customer_id = " + t.quote(*filter.customerId));
            if (filter.paymentType)
                conditions.push_back("payment_type = " + t.quote(domain::toString(*filter.paymentType)));
            if (filter.createdBy)
                conditions.push_back("created_by = " + t.quote(*filter.createdBy));
            if (filter.from)
                conditions.push_back("invoices.created_at >= " + t.quote(filter.from->toString()) + "::timestamptz");
            if (filter.to)
                conditions.push_back("invoices.created_at <= " + t.quote(filter.to->toString()) + "::timestamptz");
            return join(conditions);
        }
    };

} // namespace invoicing::adapters::secondary
