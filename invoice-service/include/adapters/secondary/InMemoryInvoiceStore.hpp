#pragma once

#include "ports/output/IInvoiceStore.hpp"
#include "settings/LockSettings.hpp"
#include "domain/Errors.hpp"
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace invoicing::adapters::secondary {

/**
 * @brief In-memory хранилище счетов, товаров и журнала склада
 *
 * Блокировки счёта и товаров: std::timed_mutex на ключ, берутся
 * в порядке LockSet с ожиданием LockSettings::getLockTimeout();
 * запись удаляется, когда ключ никто не держит и не ждёт.
 * Изменения единицы работы копятся отдельно и применяются
 * в commit() одним шагом под эксклюзивной блокировкой данных.
 */
class InMemoryInvoiceStore : public ports::output::IInvoiceStore {
public:
    explicit InMemoryInvoiceStore(std::shared_ptr<settings::LockSettings> lockSettings)
        : lockSettings_(std::move(lockSettings))
    {
        std::cout << "[InMemoryInvoiceStore] Created, lock timeout "
                  << lockSettings_->getLockTimeout().count() << "ms" << std::endl;
    }

    // ================================================================
    // Товары
    // ================================================================

    void addProduct(const domain::Product& product) {
        std::unique_lock<std::shared_mutex> lock(dataMutex_);
        products_[product.id] = product;
    }

    std::optional<domain::Product> findProduct(const std::string& productId) const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        auto it = products_.find(productId);
        return it != products_.end() ? std::optional(it->second) : std::nullopt;
    }

    std::vector<domain::Product> findProducts(const std::vector<std::string>& productIds) const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        std::set<std::string> unique(productIds.begin(), productIds.end());

        std::vector<domain::Product> result;
        for (const auto& id : unique) {
            auto it = products_.find(id);
            if (it != products_.end()) {
                result.push_back(it->second);
            }
        }
        return result;
    }

    // ================================================================
    // Счета
    // ================================================================

    std::unique_ptr<ports::output::IUnitOfWork> begin(const ports::output::LockSet& locks) override {
        std::vector<std::string> keys;
        if (!locks.invoiceId.empty()) {
            keys.push_back("invoice:" + locks.invoiceId);
        }
        std::set<std::string> productIds(locks.productIds.begin(), locks.productIds.end());
        for (const auto& id : productIds) {
            keys.push_back("product:" + id);
        }

        std::vector<std::string> held;
        for (const auto& key : keys) {
            std::timed_mutex* m = acquireLock(key);
            if (!m->try_lock_for(lockSettings_->getLockTimeout())) {
                releaseLock(key, false);
                for (auto it = held.rbegin(); it != held.rend(); ++it) {
                    releaseLock(*it, true);
                }
                throw ports::output::LockContentionException("Timed out waiting for " + key);
            }
            held.push_back(key);
        }

        return std::make_unique<UnitOfWork>(*this, std::move(held));
    }

    domain::Invoice insert(const domain::Invoice& invoice) override {
        std::unique_lock<std::shared_mutex> lock(dataMutex_);

        domain::Invoice saved = invoice;
        int year = domain::Invoice::numberingYear(saved.createdAt);
        saved.number = domain::Invoice::formatNumber(year, ++yearSequences_[year]);

        invoices_[saved.id] = Record{saved, ++insertSequence_};
        return saved;
    }

    std::optional<domain::Invoice> findById(const std::string& invoiceId) override {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        auto it = invoices_.find(invoiceId);
        return it != invoices_.end() ? std::optional(it->second.invoice) : std::nullopt;
    }

    domain::InvoicePage find(const domain::InvoiceFilter& filter) override {
        std::vector<const Record*> matched;

        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        for (const auto& [id, record] : invoices_) {
            if (filter.matches(record.invoice)) {
                matched.push_back(&record);
            }
        }

        // новые первыми; при равном времени решает порядок вставки
        std::sort(matched.begin(), matched.end(), [](const Record* a, const Record* b) {
            if (!(a->invoice.createdAt == b->invoice.createdAt)) {
                return a->invoice.createdAt > b->invoice.createdAt;
            }
            return a->sequence > b->sequence;
        });

        domain::InvoicePage page;
        page.total = static_cast<int64_t>(matched.size());

        size_t from = std::min(matched.size(), static_cast<size_t>(std::max(filter.skip, 0)));
        size_t to = std::min(matched.size(), from + static_cast<size_t>(std::max(filter.limit, 0)));
        for (size_t i = from; i < to; ++i) {
            page.items.push_back(matched[i]->invoice);
        }
        return page;
    }

    // ================================================================
    // Журнал
    // ================================================================

    std::vector<domain::InventoryTransaction> findTransactions(const domain::TransactionFilter& filter) override {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);

        std::vector<domain::InventoryTransaction> result;
        int skipped = 0;
        for (auto it = transactions_.rbegin(); it != transactions_.rend(); ++it) {
            if (filter.productId && it->productId != *filter.productId) continue;
            if (filter.invoiceId && it->invoiceId != *filter.invoiceId) continue;
            if (filter.kind && it->kind != *filter.kind) continue;

            if (skipped < filter.skip) {
                ++skipped;
                continue;
            }
            if (static_cast<int>(result.size()) >= filter.limit) {
                break;
            }
            result.push_back(*it);
        }
        return result;
    }

    std::vector<domain::InventoryTransaction> transactionsForProduct(const std::string& productId) override {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);

        std::vector<domain::InventoryTransaction> result;
        std::copy_if(transactions_.begin(), transactions_.end(), std::back_inserter(result),
            [&productId](const domain::InventoryTransaction& t) { return t.productId == productId; });
        return result;
    }

    /**
     * @brief Весь журнал в порядке записи (для сверки в тестах)
     */
    std::vector<domain::InventoryTransaction> allTransactions() const {
        std::shared_lock<std::shared_mutex> lock(dataMutex_);
        return transactions_;
    }

    /**
     * @brief Число живых записей в таблице блокировок
     */
    size_t lockTableSize() const {
        std::lock_guard<std::mutex> lock(locksMutex_);
        return locks_.size();
    }

private:
    struct Record {
        domain::Invoice invoice;
        uint64_t sequence = 0;
    };

    /**
     * @brief Изменения копятся здесь до commit(), деструктор отпускает блокировки
     */
    class UnitOfWork : public ports::output::IUnitOfWork {
    public:
        UnitOfWork(InMemoryInvoiceStore& store, std::vector<std::string> held)
            : store_(store), held_(std::move(held)) {}

        ~UnitOfWork() override {
            for (auto it = held_.rbegin(); it != held_.rend(); ++it) {
                store_.releaseLock(*it, true);
            }
        }

        std::optional<domain::Invoice> findInvoice(const std::string& invoiceId) override {
            auto staged = invoices_.find(invoiceId);
            if (staged != invoices_.end()) {
                return staged->second;
            }
            return store_.findById(invoiceId);
        }

        std::optional<domain::Product> findProduct(const std::string& productId) override {
            auto product = store_.findProduct(productId);
            if (!product) {
                return std::nullopt;
            }
            auto staged = quantities_.find(productId);
            if (staged != quantities_.end()) {
                product->quantityAvailable = staged->second;
            }
            return product;
        }

        std::vector<domain::InventoryTransaction> transactionsForInvoice(const std::string& invoiceId) override {
            std::vector<domain::InventoryTransaction> result;
            {
                std::shared_lock<std::shared_mutex> lock(store_.dataMutex_);
                for (const auto& t : store_.transactions_) {
                    if (t.invoiceId == invoiceId) {
                        result.push_back(t);
                    }
                }
            }
            for (const auto& t : transactions_) {
                if (t.invoiceId == invoiceId) {
                    result.push_back(t);
                }
            }
            return result;
        }

        void appendTransaction(const domain::InventoryTransaction& txn) override {
            auto product = findProduct(txn.productId);
            if (!product) {
                throw domain::NotFoundException("Product", txn.productId);
            }

            int64_t next = product->quantityAvailable + txn.delta;
            if (next < 0) {
                throw domain::InsufficientStockException(std::vector<domain::StockShortfall>{
                    {txn.productId, -txn.delta, product->quantityAvailable}});
            }

            quantities_[txn.productId] = next;
            transactions_.push_back(txn);
        }

        bool updateInvoice(const domain::Invoice& invoice, domain::InvoiceStatus expected) override {
            auto current = findInvoice(invoice.id);
            if (!current || current->status != expected) {
                return false;
            }
            invoices_[invoice.id] = invoice;
            return true;
        }

        void commit() override {
            std::unique_lock<std::shared_mutex> lock(store_.dataMutex_);

            for (const auto& [id, invoice] : invoices_) {
                auto it = store_.invoices_.find(id);
                if (it != store_.invoices_.end()) {
                    it->second.invoice = invoice;
                }
            }
            for (const auto& [id, quantity] : quantities_) {
                store_.products_[id].quantityAvailable = quantity;
            }
            store_.transactions_.insert(store_.transactions_.end(), transactions_.begin(), transactions_.end());

            invoices_.clear();
            quantities_.clear();
            transactions_.clear();
        }

    private:
        InMemoryInvoiceStore& store_;
        std::vector<std::string> held_;

        std::map<std::string, domain::Invoice> invoices_;
        std::map<std::string, int64_t> quantities_;
        std::vector<domain::InventoryTransaction> transactions_;
    };

    std::shared_ptr<settings::LockSettings> lockSettings_;

    mutable std::shared_mutex dataMutex_;
    std::unordered_map<std::string, domain::Product> products_;
    std::unordered_map<std::string, Record> invoices_;
    std::vector<domain::InventoryTransaction> transactions_;
    std::map<int, int64_t> yearSequences_;
    uint64_t insertSequence_ = 0;

    // Запись живёт, пока её держит или ждёт хотя бы одна единица работы
    struct LockEntry {
        std::timed_mutex mutex;
        int users = 0;
    };

    mutable std::mutex locksMutex_;
    std::unordered_map<std::string, std::unique_ptr<LockEntry>> locks_;

    std::timed_mutex* acquireLock(const std::string& key) {
        std::lock_guard<std::mutex> lock(locksMutex_);
        auto& slot = locks_[key];
        if (!slot) {
            slot = std::make_unique<LockEntry>();
        }
        ++slot->users;
        return &slot->mutex;
    }

    void releaseLock(const std::string& key, bool locked) {
        std::lock_guard<std::mutex> lock(locksMutex_);
        auto it = locks_.find(key);
        if (it == locks_.end()) {
            return;
        }
        if (locked) {
            it->second->mutex.unlock();
        }
        if (--it->second->users == 0) {
            locks_.erase(it);
        }
    }
};

} // namespace invoicing::adapters::secondary
