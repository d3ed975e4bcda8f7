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
     * @brief user.add name=... [company=<id>] [email=...] [role=...] [department=...]
     */
    class AddUserHandler : public ICommandHandler
    {
    public:
        explicit AddUserHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[AddUserHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("AddUserHandler", res, [&]
                    {
                ports::input::UserRequest request;
                request.name = req.require("name");
                request.companyId = args::optionalId(req, "company");
                request.email = req.getOr("email", "");
                request.role = req.getOr("role", "");
                request.department = req.getOr("department", "");

                return json::toJson(accountService_->addUser(request)); });
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bookkeeping::adapters::primary
