#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include "../common/MacAddress.hpp"

namespace lan_recon::scanner
{
    class VendorLookup
    {
    public:
        virtual ~VendorLookup() = default;
        virtual std::optional<std::string> Lookup(const common::HardwareAddress &mac) = 0;
    };

    // Spaces callers at least `minInterval` apart; Acquire blocks until the
    // caller's slot is reached.
    class RateLimiter
    {
    public:
        explicit RateLimiter(std::chrono::milliseconds minInterval);
        void Acquire();

    private:
        std::mutex m_mutex;
        std::chrono::milliseconds m_interval;
        std::chrono::steady_clock::time_point m_next;
    };

    struct HttpResponse
    {
        int status = 0;
        std::string body;
    };

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw);

    // GET https://api.macvendors.com/<mac>: 200 carries the vendor, 404 means unknown.
    class OnlineVendorClient : public VendorLookup
    {
    public:
        explicit OnlineVendorClient(std::string host = "api.macvendors.com",
                                    int port = 443,
                                    std::chrono::milliseconds minInterval = std::chrono::milliseconds(1000),
                                    std::chrono::seconds timeout = std::chrono::seconds(5));
        ~OnlineVendorClient();

        std::optional<std::string> Lookup(const common::HardwareAddress &mac) override;

    private:
        void InitSSL();
        void CleanupSSL();
        int ConnectSocket();
        std::optional<HttpResponse> HttpsGet(const std::string &path);

        std::string m_host;
        int m_port;
        std::chrono::seconds m_timeout;
        RateLimiter m_limiter;
        SSL_CTX *m_ssl_ctx;

        OnlineVendorClient(const OnlineVendorClient &) = delete;
        OnlineVendorClient &operator=(const OnlineVendorClient &) = delete;
    };
}
