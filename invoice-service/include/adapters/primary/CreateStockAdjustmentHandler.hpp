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
     * @brief POST /api/v1/inventory/adjustments: ручная корректировка остатка
     *
     * Тело: product_id, quantity_change (≠ 0), notes.
     */
    class CreateStockAdjustmentHandler : public IHttpHandler
    {
    public:
        explicit CreateStockAdjustmentHandler(
            std::shared_ptr<ports::input::IInventoryService> inventoryService) : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[CreateStockAdjustmentHandler] Created" << std::endl;
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

            HttpErrorMapper::guard("CreateStockAdjustmentHandler", res, [&]
                                   {
                auto body = nlohmann::json::parse(req.getBody());
                auto txn = inventoryService_->adjustStock(*actor, InvoiceJson::parseAdjustment(body));
                res.setResult(201, "application/json", InvoiceJson::toJson(txn).dump()); });
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace invoicing::adapters::primary
