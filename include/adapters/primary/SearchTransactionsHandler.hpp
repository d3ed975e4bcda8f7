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
     * @brief transaction.search term=... — по описанию, референсу и именам сторон
     */
    class SearchTransactionsHandler : public ICommandHandler
    {
    public:
        explicit SearchTransactionsHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[SearchTransactionsHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("SearchTransactionsHandler", res, [&]
                    {
                std::string term = req.require("term");
                if (term.empty())
                {
                    throw domain::ValidationError("term", "must not be empty");
                }
                auto transactions = transactionService_->search(term);

                nlohmann::json response;
                response["term"] = term;
                response["transactions"] = json::toJsonArray(transactions);
                response["count"] = transactions.size();
                return response; });
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
    };

} // namespace bookkeeping::adapters::primary
