#pragma once

#include <memory>
#include "../common/CancellationToken.hpp"
#include "CommandRegistry.hpp"

namespace lan_recon::cli
{
    // scan, monitor, wake, fingerprint, ports, subnet. Long-running commands
    // return early once `token` is cancelled.
    void RegisterCommands(CommandRegistry &registry, std::shared_ptr<common::CancellationToken> token);
}
