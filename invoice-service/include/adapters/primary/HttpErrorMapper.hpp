#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "domain/Errors.hpp"
#include "domain/User.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <iostream>

namespace invoicing::adapters::primary
{

    /**
     * @brief Общие функции HTTP-слоя: тело ошибки, инициатор запроса, маппинг исключений
     */
    class HttpErrorMapper
    {
    public:
        static void sendError(IResponse &res, int status, const std::string &code, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = code;
            error["message"] = message;
            res.setResult(status, "application/json", error.dump());
        }

        /**
         * @brief Actor, положенный в attributes ActorExtractorMiddleware
         */
        static std::optional<domain::Actor> actorFrom(IRequest &req)
        {
            auto userId = req.getAttribute("userId").value_or("");
            auto role = req.getAttribute("role").value_or("");
            if (userId.empty() || role.empty())
                return std::nullopt;

            try
            {
                return domain::Actor{userId, domain::parseUserRole(role)};
            }
            catch (const std::invalid_argument &)
            {
                return std::nullopt;
            }
        }

        static int statusFor(const domain::InvoicingException &e)
        {
            if (dynamic_cast<const domain::ForbiddenException *>(&e))
                return 403;
            if (dynamic_cast<const domain::NotFoundException *>(&e))
                return 404;
            if (dynamic_cast<const domain::ConflictException *>(&e))
                return 409;
            // invalid_transition, insufficient_stock, validation_error
            return 400;
        }

        /**
         * @brief Выполнить fn, превращая исключения в HTTP-ответ
         */
        template <typename Fn>
        static void guard(const std::string &component, IResponse &res, Fn &&fn)
        {
            try
            {
                fn();
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "invalid_json", std::string("Invalid JSON: ") + e.what());
            }
            catch (const domain::InsufficientStockException &e)
            {
                nlohmann::json error;
                error["error"] = e.code();
                error["message"] = e.what();
                error["shortfalls"] = nlohmann::json::array();
                for (const auto &s : e.shortfalls())
                {
                    error["shortfalls"].push_back({{"product_id", s.productId},
                                                   {"requested", s.requested},
                                                   {"available", s.available},
                                                   {"shortfall", s.shortfall()}});
                }
                res.setResult(400, "application/json", error.dump());
            }
            catch (const domain::InvoicingException &e)
            {
                sendError(res, statusFor(e), e.code(), e.what());
            }
            catch (const std::invalid_argument &e)
            {
                sendError(res, 400, "validation_error", e.what());
            }
            catch (const std::out_of_range &e)
            {
                sendError(res, 400, "validation_error", std::string("Value out of range: ") + e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[" << component << "] Error: " << e.what() << std::endl;
                sendError(res, 500, "internal_error", "Internal server error");
            }
        }
    };

} // namespace invoicing::adapters::primary
