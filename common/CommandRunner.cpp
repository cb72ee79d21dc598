#include "CommandRunner.hpp"
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>
#include <unistd.h>

namespace lan_recon::common
{
    namespace
    {
        std::string ShellQuote(const std::string &arg)
        {
            std::string quoted = "'";
            for (char c : arg)
            {
                if (c == '\'')
                    quoted += "'\\''";
                else
                    quoted += c;
            }
            quoted += "'";
            return quoted;
        }
    }

    bool PosixCommandRunner::IsAvailable(const std::string &program) const
    {
        if (program.empty())
            return false;
        if (program.find('/') != std::string::npos)
            return access(program.c_str(), X_OK) == 0;

        const char *path = std::getenv("PATH");
        if (!path)
            return false;

        std::string dirs(path);
        size_t start = 0;
        while (start <= dirs.size())
        {
            size_t end = dirs.find(':', start);
            if (end == std::string::npos)
                end = dirs.size();

            std::string dir = dirs.substr(start, end - start);
            if (!dir.empty())
            {
                std::string candidate = dir + "/" + program;
                if (access(candidate.c_str(), X_OK) == 0)
                    return true;
            }
            start = end + 1;
        }
        return false;
    }

    CommandResult PosixCommandRunner::Run(const std::vector<std::string> &argv,
                                          std::chrono::seconds timeout) const
    {
        CommandResult result;
        if (argv.empty())
            return result;

        std::string cmd;
        if (timeout.count() > 0 && IsAvailable("timeout"))
            cmd = "timeout " + std::to_string(timeout.count()) + " ";
        for (size_t i = 0; i < argv.size(); ++i)
        {
            if (i > 0)
                cmd += ' ';
            cmd += ShellQuote(argv[i]);
        }
        cmd += " 2>/dev/null";

        FILE *pipe = popen(cmd.c_str(), "r");
        if (!pipe)
            return result;

        result.started = true;
        char buf[512];
        while (fgets(buf, sizeof(buf), pipe))
            result.output += buf;

        int status = pclose(pipe);
        if (status != -1 && WIFEXITED(status))
            result.exitCode = WEXITSTATUS(status);
        return result;
    }
}
