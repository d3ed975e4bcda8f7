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
     * @brief withdraw account=... amount=... [description=...]
     *
     * Единственная операция, которая проверяет достаточность баланса.
     */
    class WithdrawHandler : public ICommandHandler
    {
    public:
        explicit WithdrawHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[WithdrawHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("WithdrawHandler", res, [&]
                    {
                auto account = args::account(req);
                auto amount = args::amount(req);
                auto receipt = transactionService_->withdraw(account, amount, req.getOr("description", ""));
                return json::toJson(receipt); });
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
    };

} // namespace bookkeeping::adapters::primary
