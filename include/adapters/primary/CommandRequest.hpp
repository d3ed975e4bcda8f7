#pragma once

#include <map>
#include <string>
#include <optional>
#include <stdexcept>
#include <cctype>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief Синтаксическая ошибка командной строки
     */
    class BadRequestError : public std::runtime_error
    {
    public:
        explicit BadRequestError(const std::string &message)
            : std::runtime_error(message) {}
    };

    /**
     * @brief Разобранная строка консоли
     *
     * Формат: <command> key=value key="value with spaces" ...
     * Внутри кавычек допустимы \" и \\.
     *
     * @example
     * ```
     * transfer from=company:1 to=user:2 amount=1,500.00 description="June salary"
     *   command     = "transfer"
     *   description = "June salary"
     * ```
     */
    class CommandRequest
    {
    public:
        CommandRequest() = default;

        explicit CommandRequest(std::string command) : command_(std::move(command)) {}

        /**
         * @throws BadRequestError при незакрытой кавычке, аргументе без '=' или повторном ключе
         */
        static CommandRequest parse(const std::string &line)
        {
            CommandRequest request;
            std::size_t pos = 0;

            skipSpaces(line, pos);
            while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos])))
            {
                request.command_ += line[pos++];
            }

            while (true)
            {
                skipSpaces(line, pos);
                if (pos >= line.size())
                    break;

                std::string key;
                while (pos < line.size() && line[pos] != '=' && !std::isspace(static_cast<unsigned char>(line[pos])))
                {
                    key += line[pos++];
                }
                if (pos >= line.size() || line[pos] != '=' || key.empty())
                {
                    throw BadRequestError("expected key=value, got '" + key + "'");
                }
                ++pos;

                std::string value = readValue(line, pos);
                if (request.args_.count(key))
                {
                    throw BadRequestError("duplicate argument '" + key + "'");
                }
                request.args_[key] = value;
            }

            return request;
        }

        const std::string &getCommand() const { return command_; }

        bool has(const std::string &key) const { return args_.count(key) > 0; }

        std::optional<std::string> get(const std::string &key) const
        {
            auto it = args_.find(key);
            if (it == args_.end())
                return std::nullopt;
            return it->second;
        }

        std::string getOr(const std::string &key, const std::string &defaultValue) const
        {
            return get(key).value_or(defaultValue);
        }

        /**
         * @throws BadRequestError если аргумента нет
         */
        std::string require(const std::string &key) const
        {
            auto value = get(key);
            if (!value)
            {
                throw BadRequestError("missing argument '" + key + "'");
            }
            return *value;
        }

        const std::map<std::string, std::string> &getArgs() const { return args_; }

    private:
        std::string command_;
        std::map<std::string, std::string> args_;

        static void skipSpaces(const std::string &line, std::size_t &pos)
        {
            while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])))
            {
                ++pos;
            }
        }

        static std::string readValue(const std::string &line, std::size_t &pos)
        {
            std::string value;
            if (pos < line.size() && line[pos] == '"')
            {
                ++pos;
                while (true)
                {
                    if (pos >= line.size())
                    {
                        throw BadRequestError("unterminated quoted value");
                    }
                    char c = line[pos++];
                    if (c == '"')
                        break;
                    if (c == '\\' && pos < line.size())
                    {
                        c = line[pos++];
                    }
                    value += c;
                }
                if (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos])))
                {
                    throw BadRequestError("unexpected text after closing quote");
                }
                return value;
            }

            while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos])))
            {
                value += line[pos++];
            }
            return value;
        }
    };

} // namespace bookkeeping::adapters::primary
