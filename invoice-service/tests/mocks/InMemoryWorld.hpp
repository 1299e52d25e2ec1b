#pragma once

#include "application/InvoiceService.hpp"
#include "application/InventoryService.hpp"
#include "adapters/secondary/InMemoryInvoiceStore.hpp"
#include "adapters/secondary/InMemoryProductRepository.hpp"
#include "adapters/secondary/InMemoryCustomerRepository.hpp"
#include "adapters/secondary/InMemoryUserRepository.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace invoicing::tests {

/**
 * @brief Сервисы поверх in-memory адаптеров с клиентом и тремя сотрудниками
 */
class InMemoryWorld {
public:
    const domain::Actor admin{"u-admin", domain::UserRole::ADMIN};
    const domain::Actor accountant{"u-acc", domain::UserRole::ACCOUNTANT};
    const domain::Actor warehouse{"u-wh", domain::UserRole::WAREHOUSE};

    std::shared_ptr<settings::LockSettings> lockSettings = std::make_shared<settings::LockSettings>();
    std::shared_ptr<adapters::secondary::InMemoryInvoiceStore> store =
        std::make_shared<adapters::secondary::InMemoryInvoiceStore>(lockSettings);
    std::shared_ptr<adapters::secondary::InMemoryProductRepository> products =
        std::make_shared<adapters::secondary::InMemoryProductRepository>(store);
    std::shared_ptr<adapters::secondary::InMemoryCustomerRepository> customers =
        std::make_shared<adapters::secondary::InMemoryCustomerRepository>();
    std::shared_ptr<adapters::secondary::InMemoryUserRepository> users =
        std::make_shared<adapters::secondary::InMemoryUserRepository>();

    std::shared_ptr<application::InvoiceService> invoices =
        std::make_shared<application::InvoiceService>(store, products, customers, users, lockSettings);
    std::shared_ptr<application::InventoryService> inventory =
        std::make_shared<application::InventoryService>(store, products, lockSettings);

    InMemoryWorld() {
        domain::Customer customer;
        customer.id = "c-1";
        customer.firstName = "Reza";
        customer.lastName = "Karimi";
        customer.city = "Tehran";
        customer.bankAccounts.push_back({"Mellat", "6104-3377", "IR820540102680020817909002"});
        customers->add(customer);

        users->add({"u-admin", "admin@shop.ir", "Ali", "Ahmadi", domain::UserRole::ADMIN});
        users->add({"u-acc", "acc@shop.ir", "Sara", "Moradi", domain::UserRole::ACCOUNTANT});
        users->add({"u-wh", "wh@shop.ir", "Hasan", "Rahimi", domain::UserRole::WAREHOUSE});
    }

    void addProduct(const std::string& id, int64_t quantity) {
        domain::Product product;
        product.id = id;
        product.code = "CODE-" + id;
        product.name = "Fabric " + id;
        product.unit = "meter";
        product.quantityAvailable = quantity;
        store->addProduct(product);
    }

    int64_t stockOf(const std::string& productId) const {
        return store->findProduct(productId).value().quantityAvailable;
    }

    static domain::CreateInvoiceRequest requestFor(const std::vector<std::pair<std::string, int64_t>>& lines) {
        domain::CreateInvoiceRequest request;
        request.customerId = "c-1";
        request.paymentType = domain::PaymentType::CASH;
        for (const auto& [productId, quantity] : lines) {
            domain::InvoiceItemRequest item;
            item.productId = productId;
            item.quantity = quantity;
            item.unitPrice = domain::Money(150000, 0);
            request.items.push_back(item);
        }
        return request;
    }

    domain::InvoiceView createInvoice(const std::vector<std::pair<std::string, int64_t>>& lines) {
        return invoices->createInvoice(accountant, requestFor(lines));
    }

    static domain::TrackingInfo tracking() {
        return {"Tipax", "TPX-0001", "2024-03-01", 2};
    }
};

} // namespace invoicing::tests
