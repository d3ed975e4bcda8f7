#pragma once

#include "ICommandHandler.hpp"
#include "domain/Errors.hpp"
#include "domain/Endpoint.hpp"
#include "domain/Money.hpp"
#include "domain/Date.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief Разбор аргументов команд в доменные типы
     *
     * Некорректное значение даёт ValidationError с именем аргумента.
     */
    namespace args
    {

        inline int64_t id(const CommandRequest &req, const std::string &key)
        {
            std::string text = req.require(key);
            int64_t value = 0;
            std::size_t used = 0;
            try
            {
                value = std::stoll(text, &used);
            }
            catch (const std::logic_error &)
            {
                used = 0;
            }
            if (used == 0 || used != text.size() || value <= 0)
            {
                throw domain::ValidationError(key, "expected a positive integer, got '" + text + "'");
            }
            return value;
        }

        inline std::optional<int64_t> optionalId(const CommandRequest &req, const std::string &key)
        {
            auto text = req.get(key);
            if (!text || text->empty())
                return std::nullopt;
            return id(req, key);
        }

        inline domain::Money amount(const CommandRequest &req, const std::string &key = "amount")
        {
            return domain::Money::parse(req.require(key));
        }

        inline domain::Endpoint endpoint(const CommandRequest &req, const std::string &key)
        {
            return domain::Endpoint::parse(req.require(key), key);
        }

        /**
         * @brief Реальный счёт: company:<id> или user:<id>
         * @throws ValidationError если указана касса
         */
        inline domain::AccountRef account(const CommandRequest &req, const std::string &key = "account")
        {
            auto ref = endpoint(req, key).account();
            if (!ref)
            {
                throw domain::ValidationError(key, "the cash pool is not an account");
            }
            return *ref;
        }

        inline domain::Date date(const CommandRequest &req, const std::string &key = "date")
        {
            auto text = req.get(key);
            return text ? domain::Date::parse(*text) : domain::Date::today();
        }

    } // namespace args

    inline nlohmann::json errorBody(const std::string &code, const std::string &message)
    {
        nlohmann::json error;
        error["error"] = message;
        error["code"] = code;
        return error;
    }

    /**
     * @brief Выполнить действие обработчика и перевести исключения в JSON-ошибку
     *
     * | Исключение                | code                 |
     * |---------------------------|----------------------|
     * | BadRequestError           | bad_request          |
     * | ValidationError           | validation           |
     * | NotFoundError             | not_found            |
     * | InsufficientBalanceError  | insufficient_balance |
     * | ConsistencyError          | consistency          |
     * | прочие std::exception     | internal             |
     */
    template <typename Action>
    void execute(const char *component, CommandResponse &res, Action &&action)
    {
        try
        {
            res.setResult(action());
        }
        catch (const BadRequestError &e)
        {
            res.setError(errorBody("bad_request", e.what()));
        }
        catch (const domain::ValidationError &e)
        {
            auto body = errorBody("validation", e.what());
            body["field"] = e.field();
            res.setError(body);
        }
        catch (const domain::NotFoundError &e)
        {
            auto body = errorBody("not_found", e.what());
            body["entity"] = e.entity();
            body["id"] = e.id();
            res.setError(body);
        }
        catch (const domain::InsufficientBalanceError &e)
        {
            auto body = errorBody("insufficient_balance", e.what());
            body["balance"] = domain::Money::fromCents(e.balance()).toString();
            body["requested"] = domain::Money::fromCents(e.requested()).toString();
            res.setError(body);
        }
        catch (const domain::ConsistencyError &e)
        {
            auto body = errorBody("consistency", e.what());
            body["account"] = e.account();
            body["stored"] = domain::Money::fromCents(e.stored()).toString();
            body["replayed"] = domain::Money::fromCents(e.replayed()).toString();
            res.setError(body);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[" << component << "] Error: " << e.what() << std::endl;
            res.setError(errorBody("internal", e.what()));
        }
    }

} // namespace bookkeeping::adapters::primary
