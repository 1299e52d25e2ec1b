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
     * @brief POST /api/v1/invoices: создать счёт в статусе warehouse_pending
     *
     * Роли admin и accountant. Actor берётся из ActorExtractorMiddleware.
     */
    class CreateInvoiceHandler : public IHttpHandler
    {
    public:
        explicit CreateInvoiceHandler(
            std::shared_ptr<ports::input::IInvoiceService> invoiceService) : invoiceService_(std::move(invoiceService))
        {
            std::cout << "[CreateInvoiceHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
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

            HttpErrorMapper::guard("CreateInvoiceHandler", res, [&]
                                   {
                auto body = nlohmann::json::parse(req.getBody());
                auto request = InvoiceJson::parseCreateInvoice(body);

                auto view = invoiceService_->createInvoice(*actor, request);
                res.setResult(201, "application/json", InvoiceJson::toJson(view).dump()); });
        }

    private:
        std::shared_ptr<ports::input::IInvoiceService> invoiceService_;
    };

} // namespace invoicing::adapters::primary
