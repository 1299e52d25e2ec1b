#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpErrorMapper.hpp"
#include "ports/output/IAuthClient.hpp"
#include <memory>
#include <iostream>

namespace invoicing::adapters::primary
{

    /**
     * @brief Middleware: Bearer token → attributes "userId" и "role"
     */
    class ActorExtractorMiddleware : public IHttpHandler
    {
    public:
        explicit ActorExtractorMiddleware(
            std::shared_ptr<ports::output::IAuthClient> authClient) : authClient_(std::move(authClient))
        {
            std::cout << "[ActorExtractorMiddleware] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            std::string token = req.getBearerToken().value_or("");
            if (token.empty())
            {
                HttpErrorMapper::sendError(res, 401, "unauthorized", "Access token required");
                return;
            }

            auto actor = authClient_->resolveActor(token);
            if (!actor)
            {
                HttpErrorMapper::sendError(res, 401, "unauthorized", "Token not valid");
                return;
            }

            req.setAttribute("userId", actor->userId);
            req.setAttribute("role", domain::toString(actor->role));
            res.setStatus(0); // для middleware
        }

    private:
        std::shared_ptr<ports::output::IAuthClient> authClient_;
    };

} // namespace invoicing::adapters::primary
