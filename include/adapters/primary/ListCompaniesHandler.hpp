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
     * @brief company.list — все компании по имени
     */
    class ListCompaniesHandler : public ICommandHandler
    {
    public:
        explicit ListCompaniesHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[ListCompaniesHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &, CommandResponse &res) override
        {
            execute("ListCompaniesHandler", res, [&]
                    {
                auto companies = accountService_->listCompanies();

                nlohmann::json response;
                response["companies"] = json::toJsonArray(companies);
                response["count"] = companies.size();
                return response; });
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bookkeeping::adapters::primary
