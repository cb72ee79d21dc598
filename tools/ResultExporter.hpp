#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "../common/HostRecord.hpp"

namespace lan_recon::tools
{
    struct ScanReport
    {
        std::string scanTime; // ISO-8601, local time
        std::string network;  // "a.b.c.0/24"
        common::KnownHostSet hosts;
    };

    std::string FormatScanTime(std::chrono::system_clock::time_point when);

    nlohmann::json ToJson(const common::HostRecord &record);
    nlohmann::json ToJson(const ScanReport &report);

    std::string HtmlEscape(const std::string &text);
    std::string RenderHtml(const ScanReport &report);

    // Return false when the file cannot be written.
    bool WriteJson(const ScanReport &report, const std::string &path);
    bool WriteHtml(const ScanReport &report, const std::string &path);
}
