#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace lan_recon::cli
{
    struct AppConfig
    {
        std::string command;
        std::string configPath;
        bool showHelp = false;
        bool quiet = false;

        // scan / monitor
        std::string interfaceName;
        std::string segment;
        std::vector<std::string> exclude;
        size_t workers = 48;
        int timeoutMs = 500;
        bool useNeighborTable = true;
        bool useTopologyAssistant = true;
        bool onlineVendor = false;
        int intervalSeconds = 5;
        std::string jsonPath;
        std::string htmlPath;

        // wake
        std::string mac;
        std::string broadcast = "255.255.255.255";

        // fingerprint / ports / subnet
        std::string target;
        std::string cidr;
    };

    // Command line first, then the optional `--config` INI file for anything
    // the command line left unset. Throws boost::program_options::error on
    // malformed input and std::invalid_argument on out-of-range values.
    AppConfig ParseArguments(int argc, const char *const argv[]);

    std::string OptionsHelp();
}
