#pragma once

#include "ICommandHandler.hpp"
#include "CommandSupport.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/input/IAccountService.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief ledger account=company:<id>|user:<id> — выписка, новые записи первыми
     *
     * closing_balance пересчитан из журнала, stored_balance прочитан из счёта.
     */
    class GetLedgerHandler : public ICommandHandler
    {
    public:
        GetLedgerHandler(
            std::shared_ptr<ports::input::ILedgerService> ledgerService,
            std::shared_ptr<ports::input::IAccountService> accountService) : ledgerService_(std::move(ledgerService)), accountService_(std::move(accountService))
        {
            std::cout << "[GetLedgerHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("GetLedgerHandler", res, [&]
                    {
                auto account = args::account(req);
                auto entries = ledgerService_->getLedger(account);

                nlohmann::json response;
                response["account"] = account.toString();
                response["name"] = accountService_->displayName(domain::Endpoint::of(account));
                response["entries"] = json::toJsonArray(entries);
                response["closing_balance"] = json::money(domain::Ledger::closingBalance(entries));
                response["stored_balance"] = json::money(accountService_->getBalance(account));
                return response; });
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace bookkeeping::adapters::primary
