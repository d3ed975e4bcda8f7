#pragma once

#include "CommandRequest.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief Ответ на команду: JSON-документ и признак ошибки
     */
    class CommandResponse
    {
    public:
        void setResult(nlohmann::json body)
        {
            body_ = std::move(body);
            error_ = false;
        }

        void setError(nlohmann::json body)
        {
            body_ = std::move(body);
            error_ = true;
        }

        const nlohmann::json &getBody() const { return body_; }
        bool isError() const { return error_; }

    private:
        nlohmann::json body_ = nlohmann::json::object();
        bool error_ = false;
    };

    /**
     * @brief Обработчик одной консольной команды
     */
    class ICommandHandler
    {
    public:
        virtual ~ICommandHandler() = default;

        virtual void handle(const CommandRequest &req, CommandResponse &res) = 0;
    };

} // namespace bookkeeping::adapters::primary
