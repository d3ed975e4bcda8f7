#pragma once

#include "ICommandHandler.hpp"
#include "CommandSupport.hpp"
#include "ports/input/IAccountService.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief company.remove id=...
     *
     * Отказ (validation, field=account), если на компанию ссылаются транзакции.
     */
    class RemoveCompanyHandler : public ICommandHandler
    {
    public:
        explicit RemoveCompanyHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[RemoveCompanyHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("RemoveCompanyHandler", res, [&]
                    {
                int64_t id = args::id(req, "id");
                accountService_->removeCompany(id);

                nlohmann::json response;
                response["removed"] = domain::AccountRef::company(id).toString();
                return response; });
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bookkeeping::adapters::primary
