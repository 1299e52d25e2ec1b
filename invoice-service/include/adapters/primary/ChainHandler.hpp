#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpErrorMapper.hpp"
#include <memory>
#include <vector>
#include <iostream>

namespace invoicing::adapters::primary
{

    /**
     * @brief Цепочка обработчиков: middleware выставляют статус 0, чтобы передать дальше
     */
    class ChainHandler : public IHttpHandler
    {
    public:
        template <typename... Handlers>
        explicit ChainHandler(Handlers &&...handlers)
        {
            (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
        }

        void handle(IRequest &req, IResponse &res) override
        {
            for (auto &h : handlers_)
            {
                h->handle(req, res);
                if (res.getStatus() != 0)
                    return;
            }

            // вся цепочка прошла, а ответа нет
            std::cerr << "[ChainHandler] Error: middleware chain finished, but httpStatus is zero." << std::endl;
            HttpErrorMapper::sendError(res, 500, "internal_error", "Internal server error");
        }

    private:
        std::vector<std::shared_ptr<IHttpHandler>> handlers_;
    };

} // namespace invoicing::adapters::primary
