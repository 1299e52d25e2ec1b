#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpErrorMapper.hpp"
#include "adapters/primary/InvoiceJson.hpp"
#include "ports/input/IInventoryService.hpp"
#include <memory>
#include <iostream>

namespace invoicing::adapters::primary
{

    /**
     * @brief GET /api/v1/inventory/products/{id}: доступный и зарезервированный остаток
     */
    class GetProductStockHandler : public IHttpHandler
    {
    public:
        explicit GetProductStockHandler(
            std::shared_ptr<ports::input::IInventoryService> inventoryService) : inventoryService_(std::move(inventoryService))
        {
            std::cout << "[GetProductStockHandler] Created" << std::endl;
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

            std::string productId = req.getPathParam(0).value_or("");
            if (productId.empty())
            {
                HttpErrorMapper::sendError(res, 400, "validation_error", "Product ID is required");
                return;
            }

            HttpErrorMapper::guard("GetProductStockHandler", res, [&]
                                   {
                auto stock = inventoryService_->getProductStock(*actor, productId);
                res.setResult(200, "application/json", InvoiceJson::toJson(stock).dump()); });
        }

    private:
        std::shared_ptr<ports::input::IInventoryService> inventoryService_;
    };

} // namespace invoicing::adapters::primary
