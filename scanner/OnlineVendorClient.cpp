#include "OnlineVendorClient.hpp"
#include <cctype>
#include <cstring>
#include <iostream>
#include <netdb.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace lan_recon::scanner
{
    RateLimiter::RateLimiter(std::chrono::milliseconds minInterval)
        : m_interval(minInterval), m_next(std::chrono::steady_clock::time_point::min())
    {
    }

    void RateLimiter::Acquire()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = std::chrono::steady_clock::now();
        if (now < m_next)
        {
            std::this_thread::sleep_until(m_next);
            now = std::chrono::steady_clock::now();
        }
        m_next = now + m_interval;
    }

    std::optional<HttpResponse> ParseHttpResponse(const std::string &raw)
    {
        const std::string prefix = "HTTP/";
        if (raw.compare(0, prefix.size(), prefix) != 0)
            return std::nullopt;

        auto space = raw.find(' ');
        auto lineEnd = raw.find("\r\n");
        if (space == std::string::npos || lineEnd == std::string::npos || space > lineEnd)
            return std::nullopt;

        HttpResponse response;
        try
        {
            response.status = std::stoi(raw.substr(space + 1, 3));
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }

        auto headerEnd = raw.find("\r\n\r\n");
        if (headerEnd != std::string::npos)
            response.body = raw.substr(headerEnd + 4);

        while (!response.body.empty() && std::isspace(static_cast<unsigned char>(response.body.back())))
            response.body.pop_back();
        return response;
    }

    OnlineVendorClient::OnlineVendorClient(std::string host, int port, std::chrono::milliseconds minInterval,
                                           std::chrono::seconds timeout)
        : m_host(std::move(host)), m_port(port), m_timeout(timeout), m_limiter(minInterval), m_ssl_ctx(nullptr)
    {
        InitSSL();
    }

    OnlineVendorClient::~OnlineVendorClient()
    {
        CleanupSSL();
    }

    void OnlineVendorClient::InitSSL()
    {
        m_ssl_ctx = SSL_CTX_new(TLS_client_method());
        if (!m_ssl_ctx)
        {
            ERR_print_errors_fp(stderr);
            return;
        }

        SSL_CTX_set_default_verify_paths(m_ssl_ctx);
        SSL_CTX_set_verify(m_ssl_ctx, SSL_VERIFY_PEER, nullptr);
    }

    void OnlineVendorClient::CleanupSSL()
    {
        if (m_ssl_ctx)
        {
            SSL_CTX_free(m_ssl_ctx);
            m_ssl_ctx = nullptr;
        }
    }

    int OnlineVendorClient::ConnectSocket()
    {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo *res = nullptr;
        std::string port = std::to_string(m_port);
        if (getaddrinfo(m_host.c_str(), port.c_str(), &hints, &res) != 0 || !res)
            return -1;

        int fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
        if (fd >= 0)
        {
            struct timeval tv;
            tv.tv_sec = static_cast<time_t>(m_timeout.count());
            tv.tv_usec = 0;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof tv);
            setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof tv);

            if (connect(fd, res->ai_addr, res->ai_addrlen) < 0)
            {
                close(fd);
                fd = -1;
            }
        }

        freeaddrinfo(res);
        return fd;
    }

    std::optional<HttpResponse> OnlineVendorClient::HttpsGet(const std::string &path)
    {
        if (!m_ssl_ctx)
            return std::nullopt;

        int fd = ConnectSocket();
        if (fd < 0)
            return std::nullopt;

        SSL *ssl = SSL_new(m_ssl_ctx);
        if (!ssl)
        {
            close(fd);
            return std::nullopt;
        }

        SSL_set_fd(ssl, fd);
        SSL_set_tlsext_host_name(ssl, m_host.c_str());
        SSL_set1_host(ssl, m_host.c_str());

        std::optional<HttpResponse> response;
        if (SSL_connect(ssl) == 1)
        {
            std::string request = "GET " + path + " HTTP/1.0\r\n"
                                  "Host: " + m_host + "\r\n"
                                  "User-Agent: lanrecon/1.0\r\n"
                                  "Accept: text/plain\r\n"
                                  "Connection: close\r\n\r\n";

            if (SSL_write(ssl, request.data(), static_cast<int>(request.size())) > 0)
            {
                std::string raw;
                char buf[4096];
                int n = 0;
                while ((n = SSL_read(ssl, buf, sizeof(buf))) > 0)
                    raw.append(buf, static_cast<size_t>(n));
                response = ParseHttpResponse(raw);
            }
            SSL_shutdown(ssl);
        }
        else
        {
            std::cerr << "[VendorLookup] TLS handshake with " << m_host << " failed\n";
        }

        SSL_free(ssl);
        close(fd);
        return response;
    }

    std::optional<std::string> OnlineVendorClient::Lookup(const common::HardwareAddress &mac)
    {
        m_limiter.Acquire();

        auto response = HttpsGet("/" + common::FormatMac(mac));
        if (!response)
            return std::nullopt;

        if (response->status == 200 && !response->body.empty())
            return response->body;

        if (response->status == 429)
            std::cerr << "[VendorLookup] Rate limited by " << m_host << "\n";
        return std::nullopt;
    }
}
