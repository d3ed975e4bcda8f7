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
     * @brief user.list [company=<id>]
     */
    class ListUsersHandler : public ICommandHandler
    {
    public:
        explicit ListUsersHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[ListUsersHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("ListUsersHandler", res, [&]
                    {
                auto companyId = args::optionalId(req, "company");
                auto users = companyId ? accountService_->listUsersByCompany(*companyId)
                                       : accountService_->listUsers();

                nlohmann::json response;
                response["users"] = json::toJsonArray(users);
                response["count"] = users.size();
                return response; });
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bookkeeping::adapters::primary
