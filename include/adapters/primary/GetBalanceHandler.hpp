#pragma once

#include "ICommandHandler.hpp"
#include "CommandSupport.hpp"
#include "JsonMapper.hpp"
#include "ports/input/IAccountService.hpp"
#include "settings/AppSettings.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief balance account=company:<id>|user:<id> — текущий баланс
     */
    class GetBalanceHandler : public ICommandHandler
    {
    public:
        GetBalanceHandler(
            std::shared_ptr<ports::input::IAccountService> accountService,
            std::shared_ptr<settings::AppSettings> settings) : accountService_(std::move(accountService)), settings_(std::move(settings))
        {
            std::cout << "[GetBalanceHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("GetBalanceHandler", res, [&]
                    {
                auto account = args::account(req);
                auto balance = accountService_->getBalance(account);

                nlohmann::json response;
                response["account"] = account.toString();
                response["name"] = accountService_->displayName(domain::Endpoint::of(account));
                response["balance"] = json::money(balance);
                response["formatted"] = balance.format(settings_->getCurrencySymbol());
                return response; });
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
        std::shared_ptr<settings::AppSettings> settings_;
    };

} // namespace bookkeeping::adapters::primary
