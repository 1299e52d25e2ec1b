#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpErrorMapper.hpp"
#include "adapters/primary/InvoiceJson.hpp"
#include "ports/input/IInvoiceService.hpp"
#include <memory>
#include <iostream>

namespace invoicing::adapters::primary
{

    /**
     * @brief GET /api/v1/invoices/{id}
     */
    class GetInvoiceHandler : public IHttpHandler
    {
    public:
        explicit GetInvoiceHandler(
            std::shared_ptr<ports::input::IInvoiceService> invoiceService) : invoiceService_(std::move(invoiceService))
        {
            std::cout << "[GetInvoiceHandler] Created" << std::endl;
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

            std::string invoiceId = req.getPathParam(0).value_or("");
            if (invoiceId.empty())
            {
                HttpErrorMapper::sendError(res, 400, "validation_error", "Invoice ID is required");
                return;
            }

            HttpErrorMapper::guard("GetInvoiceHandler", res, [&]
                                   {
                auto view = invoiceService_->getInvoice(*actor, invoiceId);
                res.setResult(200, "application/json", InvoiceJson::toJson(view).dump()); });
        }

    private:
        std::shared_ptr<ports::input::IInvoiceService> invoiceService_;
    };

} // namespace invoicing::adapters::primary
