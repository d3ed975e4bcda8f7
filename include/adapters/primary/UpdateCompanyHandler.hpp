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
     * @brief company.update id=... [name=...] [address=...] [phone=...] [email=...]
     *
     * Не указанные поля сохраняют текущие значения. Баланс не меняется.
     */
    class UpdateCompanyHandler : public ICommandHandler
    {
    public:
        explicit UpdateCompanyHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[UpdateCompanyHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("UpdateCompanyHandler", res, [&]
                    {
                int64_t id = args::id(req, "id");
                auto current = accountService_->getCompany(id);
                if (!current)
                {
                    throw domain::NotFoundError("company", id);
                }

                ports::input::CompanyRequest request;
                request.name = req.getOr("name", current->name);
                request.address = req.getOr("address", current->address);
                request.phone = req.getOr("phone", current->phone);
                request.email = req.getOr("email", current->email);

                return json::toJson(accountService_->updateCompany(id, request)); });
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bookkeeping::adapters::primary
