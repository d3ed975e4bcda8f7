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
     * @brief transfer from=... to=... amount=... [date=YYYY-MM-DD] [description=...] [reference=...]
     *
     * Стороны: company:<id>, user:<id> или cash.
     * Дата по умолчанию — сегодня.
     */
    class CreateTransactionHandler : public ICommandHandler
    {
    public:
        explicit CreateTransactionHandler(std::shared_ptr<ports::input::ITransactionService> transactionService)
            : transactionService_(std::move(transactionService))
        {
            std::cout << "[CreateTransactionHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &req, CommandResponse &res) override
        {
            execute("CreateTransactionHandler", res, [&]
                    {
                ports::input::TransactionRequest request;
                request.from = args::endpoint(req, "from");
                request.to = args::endpoint(req, "to");
                request.amount = args::amount(req);
                request.date = args::date(req);
                request.description = req.getOr("description", "");
                request.reference = req.getOr("reference", "");

                return json::toJson(transactionService_->createTransaction(request)); });
        }

    private:
        std::shared_ptr<ports::input::ITransactionService> transactionService_;
    };

} // namespace bookkeeping::adapters::primary
