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
     * @brief transaction.list [limit=N] [account=company:<id>|user:<id>]
     *
     * Без account — последние limit транзакций (по умолчанию 50).
     * С account — все транзакции счёта, новые первыми.
     */
    class ListTransactionsHandler : public ICommandHandler
    {
    public:
        static constexpr std::size_t DEFAULT_LIMIT = 50;

        explicit ListTransactionsHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[ListTransactionsHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("ListTransactionsHandler", res, [&]
                    {
                std::vector<domain::Transaction> transactions;
                if (req.has("account"))
                {
                    transactions = transactionService_->listByAccount(args::account(req));
                }
                else
                {
                    auto limit = req.has("limit") ? static_cast<std::size_t>(args::id(req, "limit")) : DEFAULT_LIMIT;
                    transactions = transactionService_->listTransactions(limit);
                }

                nlohmann::json response;
                response["transactions"] = json::toJsonArray(transactions);
                response["count"] = transactions.size();
                return response; });
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
    };

} // namespace bookkeeping::adapters::primary
