#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpErrorMapper.hpp"
#include "adapters/primary/InvoiceJson.hpp"
#include "ports/input/IInventoryService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace invoicing::adapters::primary
{

    /**
     * @brief GET /api/v1/inventory/transactions: журнал склада, новые первыми
     *
     * Query: product_id, invoice_id, transaction_type, skip, limit.
     */
    class GetInventoryTransactionsHandler : public IHttpHandler
    {
    public:
        explicit GetInventoryTransactionsHandler(
            std::shared_ptr<ports::input::IInventoryService> inventoryService) : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[GetInventoryTransactionsHandler] Created" << std::endl;
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

            HttpErrorMapper::guard("GetInventoryTransactionsHandler", res, [&]
                                   {
                domain::TransactionFilter filter;

                auto productId = req.getQueryParam("product_id").value_or("");
                if (!productId.empty())
                    filter.productId = productId;

                auto invoiceId = req.getQueryParam("invoice_id").value_or("");
                if (!invoiceId.empty())
                    filter.invoiceId = invoiceId;

                auto kind = req.getQueryParam("transaction_type").value_or("");
                if (!kind.empty())
                    filter.kind = domain::parseTransactionKind(kind);

                auto skip = req.getQueryParam("skip").value_or("");
                if (!skip.empty())
                    filter.skip = std::stoi(skip);

                auto limit = req.getQueryParam("limit").value_or("");
                if (!limit.empty())
                    filter.limit = std::stoi(limit);

                auto transactions = inventoryService_->listTransactions(*actor, filter);

                nlohmann::json response;
                response["transactions"] = nlohmann::json::array();
                for (const auto &txn : transactions)
                    response["transactions"].push_back(InvoiceJson::toJson(txn));

                res.setResult(200, "application/json", response.dump()); });
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace invoicing::adapters::primary
