#include "AppConfig.hpp"
#include "CommandRegistry.hpp"
#include "Commands.hpp"
#include "../common/CancellationToken.hpp"
#include <boost/program_options/errors.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <thread>

namespace
{
    // SIGINT/SIGTERM are blocked in every thread and collected here. The first
    // one cancels the token, a second one exits immediately.
    void WaitForSignals(sigset_t signals, std::shared_ptr<lan_recon::common::CancellationToken> token)
    {
        int received = 0;
        while (sigwait(&signals, &received) == 0)
        {
            if (token->IsCancelled())
            {
                std::cerr << "\n[Main] Forced exit\n";
                std::_Exit(130);
            }
            std::cerr << "\n[Main] Signal " << received << " received, shutting down\n";
            token->Cancel();
        }
    }
}

int main(int argc, char *argv[])
{
    using namespace lan_recon;

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto token = std::make_shared<common::CancellationToken>();
    std::thread(WaitForSignals, signals, token).detach();

    cli::CommandRegistry registry;
    cli::RegisterCommands(registry, token);

    cli::AppConfig config;
    try
    {
        config = cli::ParseArguments(argc, argv);
    }
    catch (const boost::program_options::error &e)
    {
        std::cerr << "Configuration Error: " << e.what() << "\n\n" << registry.Usage(argv[0]) << "\n" << cli::OptionsHelp();
        return 2;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Configuration Error: " << e.what() << "\n";
        return 2;
    }

    if (config.showHelp || config.command.empty())
    {
        std::cout << registry.Usage(argv[0]) << "\n" << cli::OptionsHelp();
        return config.showHelp ? 0 : 2;
    }

    const cli::Command *command = registry.Find(config.command);
    if (!command)
    {
        std::cerr << "Unknown command '" << config.command << "'\n\n" << registry.Usage(argv[0]);
        return 2;
    }

    try
    {
        return command->handler(config);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Configuration Error: " << e.what() << '\n';
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal " << command->id << " Error: " << e.what() << '\n';
        return 1;
    }
}
