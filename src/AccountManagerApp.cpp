#include "AccountManagerApp.hpp"

// Settings
#include "settings/DbSettings.hpp"

// Application Services
#include "application/AccountService.hpp"
#include "application/TransactionService.hpp"
#include "application/LedgerService.hpp"
#include "application/ReportService.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryStorage.hpp"
#include "adapters/secondary/InMemoryCompanyRepository.hpp"
#include "adapters/secondary/InMemoryUserRepository.hpp"
#include "adapters/secondary/InMemoryTransactionRepository.hpp"
#include "adapters/secondary/PostgresConnection.hpp"
#include "adapters/secondary/PostgresCompanyRepository.hpp"
#include "adapters/secondary/PostgresUserRepository.hpp"
#include "adapters/secondary/PostgresTransactionRepository.hpp"

// Primary Adapters
#include "adapters/primary/AddCompanyHandler.hpp"
#include "adapters/primary/UpdateCompanyHandler.hpp"
#include "adapters/primary/RemoveCompanyHandler.hpp"
#include "adapters/primary/ListCompaniesHandler.hpp"
#include "adapters/primary/AddUserHandler.hpp"
#include "adapters/primary/UpdateUserHandler.hpp"
#include "adapters/primary/RemoveUserHandler.hpp"
#include "adapters/primary/ListUsersHandler.hpp"
#include "adapters/primary/GetBalanceHandler.hpp"
#include "adapters/primary/CreateTransactionHandler.hpp"
#include "adapters/primary/DepositHandler.hpp"
#include "adapters/primary/WithdrawHandler.hpp"
#include "adapters/primary/DeleteTransactionHandler.hpp"
#include "adapters/primary/ListTransactionsHandler.hpp"
#include "adapters/primary/SearchTransactionsHandler.hpp"
#include "adapters/primary/GetLedgerHandler.hpp"
#include "adapters/primary/AuditHandler.hpp"
#include "adapters/primary/ReportHandler.hpp"

#include <iostream>

namespace di = boost::di;

namespace bookkeeping
{

    AccountManagerApp::AccountManagerApp(std::istream &in, std::ostream &out)
        : ConsoleApplication(in, out)
    {
        std::cout << "[AccountManagerApp] Application created" << std::endl;
    }

    AccountManagerApp::~AccountManagerApp()
    {
        std::cout << "[AccountManagerApp] Application destroyed" << std::endl;
    }

    void AccountManagerApp::loadEnvironment(int argc, char *argv[])
    {
        std::cout << "[AccountManagerApp] Loading environment..." << std::endl;

        ConsoleApplication::loadEnvironment(argc, argv);
        settings_ = std::make_shared<settings::AppSettings>();

        std::cout << "[AccountManagerApp] Storage: "
                  << (settings_->getStorage() == settings::StorageKind::POSTGRES ? "postgres" : "memory")
                  << std::endl;
    }

    void AccountManagerApp::configureInjection()
    {
        printStartupBanner();

        std::cout << "[AccountManagerApp] Configuring Boost.DI injection..." << std::endl;

        if (settings_->getStorage() == settings::StorageKind::POSTGRES)
        {
            auto injector = di::make_injector(
                di::bind<settings::AppSettings>().to(settings_),
                di::bind<settings::DbSettings>().in(di::singleton),

                // Одно подключение на все три репозитория
                di::bind<adapters::secondary::PostgresConnection>().in(di::singleton),

                di::bind<ports::output::ICompanyRepository>()
                    .to<adapters::secondary::PostgresCompanyRepository>()
                    .in(di::singleton),
                di::bind<ports::output::IUserRepository>()
                    .to<adapters::secondary::PostgresUserRepository>()
                    .in(di::singleton),
                di::bind<ports::output::ITransactionRepository>()
                    .to<adapters::secondary::PostgresTransactionRepository>()
                    .in(di::singleton),

                di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton),
                di::bind<ports::input::ITransactionService>().to<application::TransactionService>().in(di::singleton),
                di::bind<ports::input::ILedgerService>().to<application::LedgerService>().in(di::singleton),
                di::bind<ports::input::IReportService>().to<application::ReportService>().in(di::singleton));

            if (settings_->withDemoData())
            {
                std::cout << "[AccountManagerApp] ACCOUNT_DEMO_DATA ignored for postgres storage" << std::endl;
            }

            registerHandlers(injector);
        }
        else
        {
            auto injector = di::make_injector(
                di::bind<settings::AppSettings>().to(settings_),

                // Общее состояние для трёх репозиториев
                di::bind<adapters::secondary::InMemoryStorage>().in(di::singleton),

                di::bind<ports::output::ICompanyRepository>()
                    .to<adapters::secondary::InMemoryCompanyRepository>()
                    .in(di::singleton),
                di::bind<ports::output::IUserRepository>()
                    .to<adapters::secondary::InMemoryUserRepository>()
                    .in(di::singleton),
                di::bind<ports::output::ITransactionRepository>()
                    .to<adapters::secondary::InMemoryTransactionRepository>()
                    .in(di::singleton),

                di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton),
                di::bind<ports::input::ITransactionService>().to<application::TransactionService>().in(di::singleton),
                di::bind<ports::input::ILedgerService>().to<application::LedgerService>().in(di::singleton),
                di::bind<ports::input::IReportService>().to<application::ReportService>().in(di::singleton));

            if (settings_->withDemoData())
            {
                injector.create<std::shared_ptr<adapters::secondary::InMemoryStorage>>()->seedDemoData();
            }

            registerHandlers(injector);
        }

        std::cout << "[AccountManagerApp] Injection configured" << std::endl;
    }

    template <typename Injector>
    void AccountManagerApp::registerHandlers(Injector &injector)
    {
        using namespace adapters::primary;

        // Accounts
        registerCommand("company.add", "company.add name=... [address=...] [phone=...] [email=...]",
                        injector.template create<std::shared_ptr<AddCompanyHandler>>());
        registerCommand("company.update", "company.update id=... [name=...] [address=...] [phone=...] [email=...]",
                        injector.template create<std::shared_ptr<UpdateCompanyHandler>>());
        registerCommand("company.remove", "company.remove id=...",
                        injector.template create<std::shared_ptr<RemoveCompanyHandler>>());
        registerCommand("company.list", "company.list",
                        injector.template create<std::shared_ptr<ListCompaniesHandler>>());

        registerCommand("user.add", "user.add name=... [company=<id>] [email=...] [role=...] [department=...]",
                        injector.template create<std::shared_ptr<AddUserHandler>>());
        registerCommand("user.update", "user.update id=... [name=...] [company=<id>] [email=...] [role=...] [department=...]",
                        injector.template create<std::shared_ptr<UpdateUserHandler>>());
        registerCommand("user.remove", "user.remove id=...",
                        injector.template create<std::shared_ptr<RemoveUserHandler>>());
        registerCommand("user.list", "user.list [company=<id>]",
                        injector.template create<std::shared_ptr<ListUsersHandler>>());

        registerCommand("balance", "balance account=company:<id>|user:<id>",
                        injector.template create<std::shared_ptr<GetBalanceHandler>>());

        // Transactions
        registerCommand("transfer", "transfer from=<endpoint> to=<endpoint> amount=... [date=YYYY-MM-DD] [description=...] [reference=...]",
                        injector.template create<std::shared_ptr<CreateTransactionHandler>>());
        registerCommand("deposit", "deposit account=<account> amount=... [description=...]",
                        injector.template create<std::shared_ptr<DepositHandler>>());
        registerCommand("withdraw", "withdraw account=<account> amount=... [description=...]",
                        injector.template create<std::shared_ptr<WithdrawHandler>>());
        registerCommand("transaction.delete", "transaction.delete id=...",
                        injector.template create<std::shared_ptr<DeleteTransactionHandler>>());
        registerCommand("transaction.list", "transaction.list [limit=N] [account=<account>]",
                        injector.template create<std::shared_ptr<ListTransactionsHandler>>());
        registerCommand("transaction.search", "transaction.search term=...",
                        injector.template create<std::shared_ptr<SearchTransactionsHandler>>());

        // Ledger and reports
        registerCommand("ledger", "ledger account=<account>",
                        injector.template create<std::shared_ptr<GetLedgerHandler>>());
        registerCommand("audit", "audit [account=<account>]",
                        injector.template create<std::shared_ptr<AuditHandler>>());
        registerCommand("report", "report",
                        injector.template create<std::shared_ptr<ReportHandler>>());
    }

    void AccountManagerApp::printStartupBanner()
    {
        std::cout << "========================================" << std::endl;
        std::cout << "  Account Manager" << std::endl;
        std::cout << "  Currency: " << settings_->getCurrencySymbol() << std::endl;
        std::cout << "========================================" << std::endl;
    }

} // namespace bookkeeping
