#include "ConsoleApplication.hpp"
#include "adapters/primary/CommandSupport.hpp"

namespace bookkeeping
{

    ConsoleApplication::ConsoleApplication(std::istream &in, std::ostream &out)
        : in_(in), out_(out.rdbuf())
    {
        if (out.rdbuf() == std::cout.rdbuf())
        {
            logRedirect_ = std::make_unique<StreamRedirect>(std::cout, std::cerr.rdbuf());
        }
    }

    void ConsoleApplication::run(int argc, char *argv[])
    {
        loadEnvironment(argc, argv);
        configureInjection();
        start();
    }

    void ConsoleApplication::stop()
    {
        running_ = false;
    }

    void ConsoleApplication::loadEnvironment(int argc, char *argv[])
    {
        std::cout << "[ConsoleApplication] " << (argc > 0 ? argv[0] : "app")
                  << ": settings are read from ACCOUNT_* environment variables" << std::endl;
    }

    void ConsoleApplication::start()
    {
        std::cout << "[ConsoleApplication] Ready, " << commands_.size() << " commands registered. Type 'help'." << std::endl;

        running_ = true;
        std::string line;
        while (running_ && std::getline(in_, line))
        {
            if (!processLine(line))
            {
                break;
            }
        }
        running_ = false;

        std::cout << "[ConsoleApplication] Input closed" << std::endl;
    }

    bool ConsoleApplication::processLine(const std::string &line)
    {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#')
        {
            return true;
        }

        adapters::primary::CommandRequest request;
        try
        {
            request = adapters::primary::CommandRequest::parse(line);
        }
        catch (const adapters::primary::BadRequestError &e)
        {
            print(adapters::primary::errorBody("bad_request", e.what()));
            return true;
        }

        const auto &command = request.getCommand();
        if (command == "quit" || command == "exit")
        {
            return false;
        }
        if (command == "help")
        {
            print(helpBody());
            return true;
        }

        auto it = commands_.find(command);
        if (it == commands_.end())
        {
            print(adapters::primary::errorBody("bad_request", "unknown command '" + command + "', type 'help'"));
            return true;
        }

        adapters::primary::CommandResponse response;
        it->second.handler->handle(request, response);
        print(response.getBody());
        return true;
    }

    void ConsoleApplication::registerCommand(const std::string &name,
                                             const std::string &usage,
                                             std::shared_ptr<adapters::primary::ICommandHandler> handler)
    {
        commands_[name] = Registration{usage, std::move(handler)};
    }

    nlohmann::json ConsoleApplication::helpBody() const
    {
        nlohmann::json commands = nlohmann::json::array();
        for (const auto &[name, registration] : commands_)
        {
            commands.push_back({{"command", name}, {"usage", registration.usage}});
        }
        commands.push_back({{"command", "help"}, {"usage", "help"}});
        commands.push_back({{"command", "quit"}, {"usage", "quit"}});

        nlohmann::json body;
        body["commands"] = commands;
        body["endpoints"] = "company:<id>, user:<id>, cash";
        return body;
    }

    void ConsoleApplication::print(const nlohmann::json &body)
    {
        out_ << body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    }

} // namespace bookkeeping
