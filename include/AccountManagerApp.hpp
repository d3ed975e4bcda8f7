#pragma once

#include "ConsoleApplication.hpp"
#include "settings/AppSettings.hpp"
#include <boost/di.hpp>
#include <iostream>
#include <memory>

namespace bookkeeping
{

    /**
     * @class AccountManagerApp
     * @brief Консольное приложение учёта счетов компаний и пользователей
     *
     * Архитектура: Hexagonal (Ports & Adapters)
     * - Primary Adapters: обработчики консольных команд
     * - Secondary Adapters: InMemory* или Postgres* (ACCOUNT_STORAGE)
     *
     * Dependency Injection: Boost.DI, singleton scope для хранилища и сервисов.
     */
    class AccountManagerApp : public ConsoleApplication
    {
    public:
        explicit AccountManagerApp(std::istream &in = std::cin, std::ostream &out = std::cout);
        ~AccountManagerApp() override;

    protected:
        void loadEnvironment(int argc, char *argv[]) override;
        void configureInjection() override;

    private:
        std::shared_ptr<settings::AppSettings> settings_;

        template <typename Injector>
        void registerHandlers(Injector &injector);

        void printStartupBanner();
    };

} // namespace bookkeeping
