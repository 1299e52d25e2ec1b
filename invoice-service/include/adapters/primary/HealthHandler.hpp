#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "settings/StorageSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace invoicing::adapters::primary {

/**
 * @brief GET /health, без авторизации
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<settings::StorageSettings> storage)
        : storage_(std::move(storage)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "invoice-service";
        response["storage"] = storage_->getBackend();
        response["version"] = "1.0.0";

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<settings::StorageSettings> storage_;
};

} // namespace invoicing::adapters::primary
