#pragma once

#include "ICommandHandler.hpp"
#include "CommandSupport.hpp"
#include "JsonMapper.hpp"
#include "ports/input/IAccountService.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief user.update id=... [name=...] [company=<id>|""] [email=...] [role=...] [department=...]
     *
     * company="" отвязывает пользователя от компании.
     */
    class UpdateUserHandler : public ICommandHandler
    {
    public:
        explicit UpdateUserHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[UpdateUserHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("UpdateUserHandler", res, [&]
                    {
                int64_t id = args::id(req, "id");
                auto current = accountService_->getUser(id);
                if (!current)
                {
                    throw domain::NotFoundError("user", id);
                }

                ports::input::UserRequest request;
                request.name = req.getOr("name", current->name);
                request.companyId = req.has("company") ? args::optionalId(req, "company") : current->companyId;
                request.email = req.getOr("email", current->email);
                request.role = req.getOr("role", current->role);
                request.department = req.getOr("department", current->department);

                return json::toJson(accountService_->updateUser(id, request)); });
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bookkeeping::adapters::primary
