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
     * @brief POST /api/v1/invoices/{id}/{reserve|approve|ship|deliver|cancel}
     *
     * Одно действие жизненного цикла на запрос. Для ship тело содержит
     * carrier_name, tracking_code, shipping_date, number_of_packages.
     */
    class InvoiceCommandHandler : public IHttpHandler
    {
    public:
        explicit InvoiceCommandHandler(
            std::shared_ptr<ports::input::IInvoiceService> invoiceService) : invoiceService_(std::move(invoiceService))
        {
            std::cout << "[InvoiceCommandHandler] Created" << std::endl;
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

            std::string invoiceId = req.getPathParam(0).value_or("");
            if (invoiceId.empty())
            {
                HttpErrorMapper::sendError(res, 400, "validation_error", "Invoice ID is required");
                return;
            }

            std::string action = lastSegment(req.getPath());

            HttpErrorMapper::guard("InvoiceCommandHandler", res, [&]
                                   {
                domain::InvoiceView view;
                if (action == "reserve")
                {
                    view = invoiceService_->reserve(*actor, invoiceId);
                }
                else if (action == "approve")
                {
                    view = invoiceService_->approve(*actor, invoiceId);
                }
                else if (action == "ship")
                {
                    auto body = nlohmann::json::parse(req.getBody().empty() ? "{}" : req.getBody());
                    view = invoiceService_->ship(*actor, invoiceId, InvoiceJson::parseTracking(body));
                }
                else if (action == "deliver")
                {
                    view = invoiceService_->deliver(*actor, invoiceId);
                }
                else if (action == "cancel")
                {
                    view = invoiceService_->cancel(*actor, invoiceId);
                }
                else
                {
                    HttpErrorMapper::sendError(res, 404, "not_found", "Unknown invoice action: " + action);
                    return;
                }

                res.setResult(200, "application/json", InvoiceJson::toJson(view).dump()); });
        }

    private:
        std::shared_ptr<ports::input::IInvoiceService> invoiceService_;

        static std::string lastSegment(const std::string &path)
        {
            std::string trimmed = path;
            auto query = trimmed.find('?');
            if (query != std::string::npos)
                trimmed.erase(query);
            while (!trimmed.empty() && trimmed.back() == '/')
                trimmed.pop_back();
            auto slash = trimmed.rfind('/');
            return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
        }
    };

} // namespace invoicing::adapters::primary
