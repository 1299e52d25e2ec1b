#pragma once

#include "ports/output/IInvoiceStore.hpp"
#include "settings/LockSettings.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>
#include <utility>

namespace invoicing::application {

/**
 * @brief Выполняет функцию внутри единицы работы
 *
 * Внутри ядра поглощается только конкуренция за блокировки:
 * до getRetries() повторов, затем ConflictException. Все остальные
 * исключения уходят наружу как есть, а незакоммиченная единица работы
 * откатывается в деструкторе.
 */
class UnitOfWorkRunner {
public:
    UnitOfWorkRunner(
        std::shared_ptr<ports::output::IInvoiceStore> store,
        std::shared_ptr<settings::LockSettings> settings
    ) : store_(std::move(store))
      , settings_(std::move(settings))
    {}

    template <typename Fn>
    auto run(const ports::output::LockSet& locks, Fn&& fn)
        -> decltype(fn(std::declval<ports::output::IUnitOfWork&>()))
    {
        const int maxAttempts = settings_->getRetries() + 1;
        for (int attempt = 1;; ++attempt) {
            try {
                auto uow = store_->begin(locks);
                return fn(*uow);
            } catch (const ports::output::LockContentionException& e) {
                if (attempt >= maxAttempts) {
                    std::cerr << "[UnitOfWorkRunner] Giving up after " << attempt
                              << " attempts: " << e.what() << std::endl;
                    throw domain::ConflictException(
                        "Concurrent update in progress, refetch and retry");
                }
                std::cout << "[UnitOfWorkRunner] Lock contention (" << e.what()
                          << "), retry " << attempt << "/" << settings_->getRetries() << std::endl;
            }
        }
    }

private:
    std::shared_ptr<ports::output::IInvoiceStore> store_;
    std::shared_ptr<settings::LockSettings> settings_;
};

} // namespace invoicing::application
