#pragma once

#include "ICommandHandler.hpp"
#include "CommandSupport.hpp"
#include "ports/input/ITransactionService.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief transaction.delete id=... — удалить и отменить влияние на балансы
     */
    class DeleteTransactionHandler : public ICommandHandler
    {
    public:
        explicit DeleteTransactionHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[DeleteTransactionHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("DeleteTransactionHandler", res, [&]
                    {
                int64_t id = args::id(req, "id");
                transactionService_->deleteTransaction(id);

                nlohmann::json response;
                response["deleted"] = id;
                return response; });
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
    };

} // namespace bookkeeping::adapters::primary
