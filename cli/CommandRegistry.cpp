#include "CommandRegistry.hpp"
#include <iomanip>
#include <sstream>

namespace lan_recon::cli
{
    bool CommandRegistry::Add(Command command)
    {
        if (command.id.empty() || !command.handler || Find(command.id))
            return false;
        m_commands.push_back(std::move(command));
        return true;
    }

    const Command *CommandRegistry::Find(const std::string &id) const
    {
        for (const auto &command : m_commands)
        {
            if (command.id == id)
                return &command;
        }
        return nullptr;
    }

    std::string CommandRegistry::Usage(const std::string &program) const
    {
        std::ostringstream ss;
        ss << "Usage: " << program << " <command> [options]\n\nCommands:\n";
        for (const auto &command : m_commands)
            ss << "  " << std::left << std::setw(13) << command.id << command.description << "\n";
        return ss.str();
    }
}
