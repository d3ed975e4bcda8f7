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
     * @brief company.add name=... [address=...] [phone=...] [email=...]
     */
    class AddCompanyHandler : public ICommandHandler
    {
    public:
        explicit AddCompanyHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[AddCompanyHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("AddCompanyHandler", res, [&]
                    {
                ports::input::CompanyRequest request;
                request.name = req.require("name");
                request.address = req.getOr("address", "");
                request.phone = req.getOr("phone", "");
                request.email = req.getOr("email", "");

                return json::toJson(accountService_->addCompany(request)); });
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bookkeeping::adapters::primary
