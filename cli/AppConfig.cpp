#include "AppConfig.hpp"
#include <boost/program_options.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace po = boost::program_options;

namespace lan_recon::cli
{
    namespace
    {
        // Options that may also come from the config file.
        po::options_description SharedOptions(AppConfig &config)
        {
            po::options_description options("Options");
            options.add_options()
                ("interface,i", po::value<std::string>(&config.interfaceName), "Network interface (default: the one holding the default route)")
                ("segment,s", po::value<std::string>(&config.segment), "Local /24 segment to scan, e.g. 192.168.1.0/24")
                ("exclude,x", po::value<std::vector<std::string>>(&config.exclude)->multitoken(), "Addresses to leave out of the result")
                ("workers,w", po::value<size_t>(&config.workers)->default_value(48), "Concurrent probe workers")
                ("timeout-ms", po::value<int>(&config.timeoutMs)->default_value(500), "TCP connect timeout per probe")
                ("no-arp", po::bool_switch(), "Skip the neighbor table phases")
                ("no-nmap", po::bool_switch(), "Skip the nmap bulk pass")
                ("online-vendor", po::bool_switch(&config.onlineVendor), "Query api.macvendors.com for unknown prefixes")
                ("interval", po::value<int>(&config.intervalSeconds)->default_value(5), "Seconds between monitor passes")
                ("json", po::value<std::string>(&config.jsonPath), "Write the scan result as JSON")
                ("html", po::value<std::string>(&config.htmlPath), "Write the scan result as an HTML report")
                ("mac", po::value<std::string>(&config.mac), "Hardware address to wake")
                ("broadcast", po::value<std::string>(&config.broadcast)->default_value("255.255.255.255"), "Wake-on-LAN broadcast address")
                ("target,t", po::value<std::string>(&config.target), "Host for fingerprint and ports")
                ("cidr", po::value<std::string>(&config.cidr), "Address with optional prefix for subnet, e.g. 10.0.0.7/8")
                ("quiet,q", po::bool_switch(&config.quiet), "Only print results");
            return options;
        }

        po::options_description GenericOptions(AppConfig &config)
        {
            po::options_description options("General");
            options.add_options()
                ("help,h", "Show this help")
                ("config,c", po::value<std::string>(&config.configPath), "INI file with default option values")
                ("command", po::value<std::string>(&config.command), "Command to run");
            return options;
        }
    }

    AppConfig ParseArguments(int argc, const char *const argv[])
    {
        AppConfig config;
        po::options_description shared = SharedOptions(config);
        po::options_description all;
        all.add(GenericOptions(config)).add(shared);

        po::positional_options_description positional;
        positional.add("command", 1);

        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);

        if (vm.count("config"))
        {
            const std::string path = vm["config"].as<std::string>();
            std::ifstream file(path);
            if (!file.is_open())
                throw std::invalid_argument("Cannot open config file " + path);
            po::store(po::parse_config_file(file, shared), vm);
        }

        po::notify(vm);

        config.showHelp = vm.count("help") > 0;
        config.useNeighborTable = !vm["no-arp"].as<bool>();
        config.useTopologyAssistant = !vm["no-nmap"].as<bool>();

        if (config.workers == 0 || config.workers > 254)
            throw std::invalid_argument("--workers must be between 1 and 254");
        if (config.timeoutMs <= 0)
            throw std::invalid_argument("--timeout-ms must be positive");
        if (config.intervalSeconds <= 0)
            throw std::invalid_argument("--interval must be positive");

        return config;
    }

    std::string OptionsHelp()
    {
        AppConfig scratch;
        po::options_description visible;
        po::options_description general("General");
        general.add_options()
            ("help,h", "Show this help")
            ("config,c", po::value<std::string>(), "INI file with default option values");
        visible.add(general).add(SharedOptions(scratch));

        std::ostringstream ss;
        ss << visible;
        return ss.str();
    }
}
