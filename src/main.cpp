#include "AccountManagerApp.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
bookkeeping::AccountManagerApp *g_app = nullptr;

void signalHandler(int signal)
{
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app)
    {
        g_app->stop();
    }
}

int main(int argc, char *argv[])
{
    try
    {
        // stdout отдан JSON-ответам, логи компонентов идут в stderr
        bookkeeping::AccountManagerApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Account Manager stopped" << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
