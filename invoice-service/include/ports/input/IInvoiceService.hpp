#pragma once

#include "domain/InvoiceView.hpp"
#include "domain/InvoiceFilter.hpp"
#include "domain/InvoiceRequest.hpp"
#include "domain/TrackingInfo.hpp"
#include "domain/User.hpp"
#include <string>

namespace invoicing::ports::input {

/**
 * @brief Жизненный цикл счёта и чтение счетов
 *
 * Все методы бросают исключения из domain/Errors.hpp.
 */
class IInvoiceService {
public:
    virtual ~IInvoiceService() = default;

    virtual domain::InvoiceView createInvoice(
        const domain::Actor& actor,
        const domain::CreateInvoiceRequest& request) = 0;

    /**
     * @brief warehouse_pending → accountant_pending, резерв всех строк
     */
    virtual domain::InvoiceView reserve(const domain::Actor& actor, const std::string& invoiceId) = 0;

    /**
     * @brief accountant_pending → approved
     */
    virtual domain::InvoiceView approve(const domain::Actor& actor, const std::string& invoiceId) = 0;

    /**
     * @brief approved → shipped, ship-mark по строкам и данные отправки
     */
    virtual domain::InvoiceView ship(
        const domain::Actor& actor,
        const std::string& invoiceId,
        const domain::TrackingInfo& tracking) = 0;

    /**
     * @brief shipped → delivered
     */
    virtual domain::InvoiceView deliver(const domain::Actor& actor, const std::string& invoiceId) = 0;

    /**
     * @brief → cancelled, с возвратом резерва на склад
     */
    virtual domain::InvoiceView cancel(const domain::Actor& actor, const std::string& invoiceId) = 0;

    virtual domain::InvoiceView getInvoice(const domain::Actor& actor, const std::string& invoiceId) = 0;

    virtual domain::InvoiceViewPage listInvoices(
        const domain::Actor& actor,
        const domain::InvoiceFilter& filter) = 0;
};

} // namespace invoicing::ports::input
