#pragma once

#include <functional>
#include <string>
#include <vector>
#include "AppConfig.hpp"

namespace lan_recon::cli
{
    using CommandHandler = std::function<int(const AppConfig &config)>;

    struct Command
    {
        std::string id;
        std::string description;
        CommandHandler handler;
    };

    // Commands keep their registration order for the help listing.
    class CommandRegistry
    {
    public:
        // False for an empty id, a missing handler or a duplicate id.
        bool Add(Command command);
        const Command *Find(const std::string &id) const;
        const std::vector<Command> &List() const { return m_commands; }

        std::string Usage(const std::string &program) const;

    private:
        std::vector<Command> m_commands;
    };
}
