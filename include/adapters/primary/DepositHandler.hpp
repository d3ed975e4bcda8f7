#pragma once

#include "ICommandHandler.hpp"
#include "CommandSupport.hpp"
#include "JsonMapper.hpp"
#include "ports/input/ITransactionService.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief deposit account=... amount=... [description=...]
     */
    class DepositHandler : public ICommandHandler
    {
    public:
        explicit DepositHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[DepositHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("DepositHandler", res, [&]
                    {
                auto account = args::account(req);
                auto amount = args::amount(req);
                auto receipt = transactionService_->deposit(account, amount, req.getOr("description", ""));
                return json::toJson(receipt); });
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
    };

} // namespace bookkeeping::adapters::primary
