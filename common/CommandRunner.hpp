#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace lan_recon::common
{
    struct CommandResult
    {
        bool started = false;
        int exitCode = -1;
        std::string output;
    };

    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;

        // True when `program` resolves to an executable on PATH.
        virtual bool IsAvailable(const std::string &program) const = 0;

        // Runs argv[0] with the remaining arguments, capturing stdout. The
        // command is killed once `timeout` elapses.
        virtual CommandResult Run(const std::vector<std::string> &argv,
                                  std::chrono::seconds timeout) const = 0;
    };

    class PosixCommandRunner : public CommandRunner
    {
    public:
        bool IsAvailable(const std::string &program) const override;
        CommandResult Run(const std::vector<std::string> &argv,
                          std::chrono::seconds timeout) const override;
    };
}
