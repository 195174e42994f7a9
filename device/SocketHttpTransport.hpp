#pragma once

#include <atomic>
#include <string>
#include <openssl/ssl.h>
#include "HttpTransport.hpp"

namespace switch_watch::device
{
    // HTTP/1.1 over a fresh TCP (optionally TLS) connection per request.
    // Every blocking step honours the request deadline and Cancel().
    class SocketHttpTransport : public HttpTransport
    {
    private:
        std::string m_host;
        int m_port;
        bool m_useTls;

        SSL_CTX *m_sslCtx;
        std::atomic<bool> m_cancelled{false};

        void InitSSL();
        void CleanupSSL();

    public:
        static constexpr std::size_t MAX_RESPONSE_BYTES = 8 * 1024 * 1024;

        SocketHttpTransport(std::string host, int port, bool useTls);
        ~SocketHttpTransport() override;

        SocketHttpTransport(const SocketHttpTransport &) = delete;
        SocketHttpTransport &operator=(const SocketHttpTransport &) = delete;

        HttpResponse Send(const HttpRequest &request, std::chrono::milliseconds timeout) override;
        void Cancel() override;
        void Resume() override;
        std::string Describe() const override;

        std::string BuildRequest(const HttpRequest &request) const;

        // Parses a complete raw response (status line, headers, body). Chunked bodies are decoded.
        static HttpResponse ParseResponse(const std::string &raw);

        // True once `raw` holds the full message per Content-Length or chunked framing.
        // Responses with neither are complete only at EOF.
        static bool IsComplete(const std::string &raw);
    };
}
