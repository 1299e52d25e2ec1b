#pragma once

#include "ports/output/IProductRepository.hpp"
#include "ports/output/IDirectory.hpp"
#include "domain/InvoiceView.hpp"
#include <map>
#include <memory>
#include <iostream>

namespace invoicing::application {

/**
 * @brief Жадная сборка InvoiceView: товары, клиент с банковскими счетами, создатель
 */
class InvoiceAssembler {
public:
    InvoiceAssembler(
        std::shared_ptr<ports::output::IProductRepository> products,
        std::shared_ptr<ports::output::ICustomerRepository> customers,
        std::shared_ptr<ports::output::IUserRepository> users
    ) : products_(std::move(products))
      , customers_(std::move(customers))
      , users_(std::move(users))
    {}

    domain::InvoiceView assemble(const domain::Invoice& invoice) {
        return assembleAll({invoice}).front();
    }

    /**
     * @brief Сборка страницы: товары грузятся одним пакетом на всю страницу
     */
    std::vector<domain::InvoiceView> assembleAll(const std::vector<domain::Invoice>& invoices) {
        std::vector<std::string> productIds;
        for (const auto& invoice : invoices) {
            auto ids = invoice.productIds();
            productIds.insert(productIds.end(), ids.begin(), ids.end());
        }

        std::map<std::string, domain::Product> productIndex;
        for (auto& product : products_->findByIds(productIds)) {
            productIndex[product.id] = std::move(product);
        }

        std::map<std::string, domain::Customer> customerCache;
        std::map<std::string, domain::User> userCache;

        std::vector<domain::InvoiceView> views;
        views.reserve(invoices.size());
        for (const auto& invoice : invoices) {
            domain::InvoiceView view;
            view.invoice = invoice;

            for (const auto& item : invoice.items()) {
                domain::ResolvedItem resolved;
                resolved.item = item;
                auto it = productIndex.find(item.productId);
                if (it != productIndex.end()) {
                    resolved.product = it->second;
                } else {
                    std::cerr << "[InvoiceAssembler] Missing product " << item.productId
                              << " in " << invoice.number << std::endl;
                    resolved.product.id = item.productId;
                }
                view.items.push_back(std::move(resolved));
            }

            view.customer = resolveCustomer(invoice.customerId, customerCache);
            view.creator = resolveUser(invoice.createdBy, userCache);
            views.push_back(std::move(view));
        }
        return views;
    }

private:
    std::shared_ptr<ports::output::IProductRepository> products_;
    std::shared_ptr<ports::output::ICustomerRepository> customers_;
    std::shared_ptr<ports::output::IUserRepository> users_;

    domain::Customer resolveCustomer(const std::string& id, std::map<std::string, domain::Customer>& cache) {
        auto it = cache.find(id);
        if (it != cache.end()) {
            return it->second;
        }
        domain::Customer customer;
        if (auto found = customers_->findById(id)) {
            customer = *found;
        } else {
            std::cerr << "[InvoiceAssembler] Missing customer " << id << std::endl;
            customer.id = id;
        }
        cache[id] = customer;
        return customer;
    }

    domain::User resolveUser(const std::string& id, std::map<std::string, domain::User>& cache) {
        auto it = cache.find(id);
        if (it != cache.end()) {
            return it->second;
        }
        domain::User user;
        if (auto found = users_->findById(id)) {
            user = *found;
        } else {
            std::cerr << "[InvoiceAssembler] Missing user " << id << std::endl;
            user.id = id;
        }
        cache[id] = user;
        return user;
    }
};

} // namespace invoicing::application
