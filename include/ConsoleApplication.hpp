#pragma once

#include "adapters/primary/ICommandHandler.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <iostream>
#include <map>
#include <memory>
#include <string>

namespace bookkeeping
{

    /**
     * @class ConsoleApplication
     * @brief Базовое консольное приложение: одна команда на строку stdin, один JSON на строку stdout
     *
     * Template Method:
     * 1. loadEnvironment() - чтение настроек
     * 2. configureInjection() - сборка зависимостей и registerCommand()
     * 3. start() - цикл чтения команд до quit/EOF/stop()
     *
     * Встроенные команды: help, quit (exit).
     */
    class ConsoleApplication
    {
    public:
        explicit ConsoleApplication(std::istream &in = std::cin, std::ostream &out = std::cout);
        virtual ~ConsoleApplication() = default;

        ConsoleApplication(const ConsoleApplication &) = delete;
        ConsoleApplication &operator=(const ConsoleApplication &) = delete;

        void run(int argc, char *argv[]);

        /**
         * @brief Завершить цикл после текущей команды
         */
        void stop();

        /**
         * @brief Выполнить одну строку и напечатать ответ
         * @return false, если получена команда quit
         */
        bool processLine(const std::string &line);

    protected:
        virtual void loadEnvironment(int argc, char *argv[]);
        virtual void configureInjection() = 0;
        virtual void start();

        void registerCommand(const std::string &name,
                             const std::string &usage,
                             std::shared_ptr<adapters::primary::ICommandHandler> handler);

    private:
        struct Registration
        {
            std::string usage;
            std::shared_ptr<adapters::primary::ICommandHandler> handler;
        };

        /**
         * @brief Подменить буфер потока до разрушения объекта
         */
        class StreamRedirect
        {
        public:
            StreamRedirect(std::ostream &stream, std::streambuf *target)
                : stream_(stream), previous_(stream.rdbuf(target)) {}

            ~StreamRedirect() { stream_.rdbuf(previous_); }

            StreamRedirect(const StreamRedirect &) = delete;
            StreamRedirect &operator=(const StreamRedirect &) = delete;

        private:
            std::ostream &stream_;
            std::streambuf *previous_;
        };

        std::istream &in_;
        std::ostream out_;
        std::unique_ptr<StreamRedirect> logRedirect_;
        std::atomic<bool> running_{false};
        std::map<std::string, Registration> commands_;

        nlohmann::json helpBody() const;
        void print(const nlohmann::json &body);
    };

} // namespace bookkeeping
