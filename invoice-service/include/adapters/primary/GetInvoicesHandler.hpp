#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpErrorMapper.hpp"
#include "adapters/primary/InvoiceJson.hpp"
#include "ports/input/IInvoiceService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace invoicing::adapters::primary
{

    /**
     * @brief GET /api/v1/invoices: список счетов, видимых роли
     *
     * Query: status, customer_id, payment_type, created_by,
     * start_date, end_date (YYYY-MM-DD или ISO 8601), skip, limit.
     */
    class GetInvoicesHandler : public IHttpHandler
    {
    public:
        explicit GetInvoicesHandler(
            std::shared_ptr<ports::input::IInvoiceService> invoiceService) : invoiceService_(std::move(invoiceService))
        {
            std::cout << "[GetInvoicesHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                HttpErrorMapper::sendError(res, 405, "method_not_allowed", "Method not allowed");
                return;
            }

            auto actor = HttpErrorMapper::actorFrom(req);
            if (!actor)
            {
                HttpErrorMapper::sendError(res, 401, "unauthorized", "Access token required");
                return;
            }

            HttpErrorMapper::guard("GetInvoicesHandler", res, [&]
                                   {
                auto filter = parseFilter(req);
                auto page = invoiceService_->listInvoices(*actor, filter);

                nlohmann::json response;
                response["invoices"] = nlohmann::json::array();
                for (const auto &view : page.items)
                    response["invoices"].push_back(InvoiceJson::toJson(view));
                response["total"] = page.total;
                response["skip"] = page.skip;
                response["limit"] = page.limit;

                res.setResult(200, "application/json", response.dump()); });
        }

    private:
        std::shared_ptr<ports::input::IInvoiceService> invoiceService_;

        static domain::InvoiceFilter parseFilter(IRequest &req)
        {
            domain::InvoiceFilter filter;

            auto status = req.getQueryParam("status").value_or("");
            if (!status.empty())
                filter.status = domain::parseInvoiceStatus(status);

            auto customerId = req.getQueryParam("customer_id").value_or("");
            if (!customerId.empty())
                filter.customerId = customerId;

            auto paymentType = req.getQueryParam("payment_type").value_or("");
            if (!paymentType.empty())
                filter.paymentType = domain::parsePaymentType(paymentType);

            auto createdBy = req.getQueryParam("created_by").value_or("");
            if (!createdBy.empty())
                filter.createdBy = createdBy;

            auto startDate = req.getQueryParam("start_date").value_or("");
            if (!startDate.empty())
                filter.from = domain::Timestamp::fromString(startDate);

            auto endDate = req.getQueryParam("end_date").value_or("");
            if (!endDate.empty())
                filter.to = domain::Timestamp::endOfDay(endDate);

            auto skip = req.getQueryParam("skip").value_or("");
            if (!skip.empty())
                filter.skip = std::stoi(skip);

            auto limit = req.getQueryParam("limit").value_or("");
            if (!limit.empty())
                filter.limit = std::stoi(limit);

            return filter;
        }
    };

} // namespace invoicing::adapters::primary
