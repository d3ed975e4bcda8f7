#pragma once

#include "ICommandHandler.hpp"
#include "CommandSupport.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief audit [account=...] — сверить хранимые балансы с журналом
     *
     * С account ошибка сверки приходит как code=consistency.
     */
    class AuditHandler : public ICommandHandler
    {
    public:
        explicit AuditHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[AuditHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("AuditHandler", res, [&]
                    {
                nlohmann::json response;
                if (req.has("account"))
                {
                    auto account = args::account(req);
                    ledgerService_->verifyAccount(account);
                    response["account"] = account.toString();
                    response["consistent"] = true;
                    return response;
                }

                auto issues = ledgerService_->audit();
                response["consistent"] = issues.empty();
                response["mismatches"] = json::toJsonArray(issues);
                return response; });
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace bookkeeping::adapters::primary
