#include "ResultExporter.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace lan_recon::tools
{
    std::string FormatScanTime(std::chrono::system_clock::time_point when)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(when);
        std::tm tm{};
        localtime_r(&t, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        return ss.str();
    }

    nlohmann::json ToJson(const common::HostRecord &record)
    {
        return nlohmann::json{
            {"ip", record.address.ToString()},
            {"mac", record.hardwareAddress},
            {"hostname", record.hostname},
            {"vendor", record.vendor},
            {"isLocal", record.isLocalMachine},
            {"randomizedMac", record.hasRandomizedHardwareAddress},
            {"openPorts", record.openPorts},
            {"deviceType", record.deviceType},
        };
    }

    nlohmann::json ToJson(const ScanReport &report)
    {
        nlohmann::json devices = nlohmann::json::array();
        for (const auto &entry : report.hosts)
            devices.push_back(ToJson(entry.second));

        return nlohmann::json{
            {"scanTime", report.scanTime},
            {"network", report.network},
            {"devices", devices},
        };
    }

    std::string HtmlEscape(const std::string &text)
    {
        std::string out;
        out.reserve(text.size());
        for (char c : text)
        {
            switch (c)
            {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#39;";
                break;
            default:
                out += c;
            }
        }
        return out;
    }

    std::string RenderHtml(const ScanReport &report)
    {
        std::ostringstream html;
        html << "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n"
             << "<title>LAN scan " << HtmlEscape(report.network) << "</title>\n"
             << "<style>body{font-family:sans-serif}table{border-collapse:collapse}"
             << "th,td{border:1px solid #999;padding:4px 8px}tr.local{background:#eef}</style>\n"
             << "</head>\n<body>\n"
             << "<h1>" << HtmlEscape(report.network) << "</h1>\n"
             << "<p>Scanned " << HtmlEscape(report.scanTime) << ", " << report.hosts.size() << " device(s)</p>\n"
             << "<table>\n<tr><th>IP</th><th>MAC</th><th>Hostname</th><th>Vendor</th>"
             << "<th>Local</th><th>Randomized MAC</th><th>Open ports</th><th>Device type</th></tr>\n";

        for (const auto &entry : report.hosts)
        {
            const common::HostRecord &record = entry.second;
            std::ostringstream ports;
            for (size_t i = 0; i < record.openPorts.size(); ++i)
            {
                if (i)
                    ports << ", ";
                ports << record.openPorts[i];
            }

            html << (record.isLocalMachine ? "<tr class=\"local\">" : "<tr>")
                 << "<td>" << HtmlEscape(record.address.ToString()) << "</td>"
                 << "<td>" << HtmlEscape(record.hardwareAddress) << "</td>"
                 << "<td>" << HtmlEscape(record.hostname) << "</td>"
                 << "<td>" << HtmlEscape(record.vendor) << "</td>"
                 << "<td>" << (record.isLocalMachine ? "yes" : "") << "</td>"
                 << "<td>" << (record.hasRandomizedHardwareAddress ? "yes" : "") << "</td>"
                 << "<td>" << ports.str() << "</td>"
                 << "<td>" << HtmlEscape(record.deviceType) << "</td></tr>\n";
        }

        html << "</table>\n</body>\n</html>\n";
        return html.str();
    }

    namespace
    {
        bool WriteFile(const std::string &path, const std::string &content)
        {
            std::ofstream file(path, std::ios::trunc);
            if (!file.is_open())
            {
                std::cerr << "[Export] Cannot open " << path << " for writing\n";
                return false;
            }
            file << content;
            return static_cast<bool>(file);
        }
    }

    bool WriteJson(const ScanReport &report, const std::string &path)
    {
        // Names read off the wire are not guaranteed UTF-8.
        std::string content = ToJson(report).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        return WriteFile(path, content + "\n");
    }

    bool WriteHtml(const ScanReport &report, const std::string &path)
    {
        return WriteFile(path, RenderHtml(report));
    }
}
