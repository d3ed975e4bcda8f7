#pragma once

#include "ICommandHandler.hpp"
#include "CommandSupport.hpp"
#include "ports/input/IAccountService.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief user.remove id=...
     */
    class RemoveUserHandler : public ICommandHandler
    {
    public:
        explicit RemoveUserHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[RemoveUserHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("RemoveUserHandler", res, [&]
                    {
                int64_t id = args::id(req, "id");
                accountService_->removeUser(id);

                nlohmann::json response;
                response["removed"] = domain::AccountRef::user(id).toString();
                return response; });
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bookkeeping::adapters::primary
