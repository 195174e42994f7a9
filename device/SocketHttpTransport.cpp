#include "SocketHttpTransport.hpp"
#include <openssl/err.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace switch_watch::device
{
    namespace
    {
        using SteadyClock = std::chrono::steady_clock;
        constexpr int POLL_SLICE_MS = 100;

        enum class IoStatus
        {
            Ok,
            Eof,
            Timeout,
            Cancelled,
            Failed
        };

        struct Connection
        {
            int fd = -1;
            SSL *ssl = nullptr;

            Connection() = default;
            Connection(const Connection &) = delete;
            Connection &operator=(const Connection &) = delete;

            ~Connection()
            {
                if (ssl)
                {
                    SSL_shutdown(ssl);
                    SSL_free(ssl);
                }
                if (fd != -1)
                    close(fd);
            }
        };

        std::string SslErrorString()
        {
            unsigned long code = ERR_get_error();
            if (code == 0)
                return "unknown TLS error";
            char buf[256];
            ERR_error_string_n(code, buf, sizeof(buf));
            return buf;
        }

        IoStatus WaitFd(int fd, short events, SteadyClock::time_point deadline, const std::atomic<bool> &cancelled)
        {
            while (true)
            {
                if (cancelled.load())
                    return IoStatus::Cancelled;

                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now()).count();
                if (left <= 0)
                    return IoStatus::Timeout;

                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = events;

                int r = poll(&pfd, 1, static_cast<int>(std::min<long long>(left, POLL_SLICE_MS)));
                if (r > 0)
                    return IoStatus::Ok;
                if (r < 0 && errno != EINTR)
                    return IoStatus::Failed;
            }
        }

        TransportError ToError(IoStatus status, const std::string &what)
        {
            switch (status)
            {
            case IoStatus::Timeout:
                return {TransportErrorKind::Timeout, what + " timed out"};
            case IoStatus::Cancelled:
                return {TransportErrorKind::Cancelled, what + " cancelled"};
            default:
                return {TransportErrorKind::Unreachable, what + " failed"};
            }
        }

        IoStatus ConnectTcp(Connection &conn, const std::string &host, int port,
                            SteadyClock::time_point deadline, const std::atomic<bool> &cancelled,
                            std::string &error)
        {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;

            addrinfo *result = nullptr;
            const std::string service = std::to_string(port);
            int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
            if (rc != 0)
            {
                error = std::string("resolve ") + host + ": " + gai_strerror(rc);
                return IoStatus::Failed;
            }

            IoStatus status = IoStatus::Failed;
            error = "connect " + host + ":" + service + " failed";

            for (addrinfo *ai = result; ai != nullptr; ai = ai->ai_next)
            {
                int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
                if (fd < 0)
                    continue;

                int flags = fcntl(fd, F_GETFL, 0);
                fcntl(fd, F_SETFL, flags | O_NONBLOCK);

                if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0)
                {
                    conn.fd = fd;
                    status = IoStatus::Ok;
                    break;
                }

                if (errno != EINPROGRESS)
                {
                    error = "connect " + host + ":" + service + ": " + std::strerror(errno);
                    close(fd);
                    continue;
                }

                status = WaitFd(fd, POLLOUT, deadline, cancelled);
                if (status != IoStatus::Ok)
                {
                    close(fd);
                    if (status == IoStatus::Failed)
                        continue;
                    break;
                }

                int soError = 0;
                socklen_t len = sizeof(soError);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0)
                {
                    error = "connect " + host + ":" + service + ": " + std::strerror(soError ? soError : errno);
                    close(fd);
                    status = IoStatus::Failed;
                    continue;
                }

                conn.fd = fd;
                status = IoStatus::Ok;
                break;
            }

            freeaddrinfo(result);
            return status;
        }

        IoStatus ConnectTls(Connection &conn, SSL_CTX *ctx, const std::string &host,
                            SteadyClock::time_point deadline, const std::atomic<bool> &cancelled,
                            std::string &error)
        {
            conn.ssl = SSL_new(ctx);
            if (!conn.ssl)
            {
                error = SslErrorString();
                return IoStatus::Failed;
            }
            SSL_set_fd(conn.ssl, conn.fd);
            SSL_set_tlsext_host_name(conn.ssl, host.c_str());

            while (true)
            {
                int n = SSL_connect(conn.ssl);
                if (n == 1)
                    return IoStatus::Ok;

                int err = SSL_get_error(conn.ssl, n);
                IoStatus status;
                if (err == SSL_ERROR_WANT_READ)
                    status = WaitFd(conn.fd, POLLIN, deadline, cancelled);
                else if (err == SSL_ERROR_WANT_WRITE)
                    status = WaitFd(conn.fd, POLLOUT, deadline, cancelled);
                else
                {
                    error = "TLS handshake: " + SslErrorString();
                    return IoStatus::Failed;
                }

                if (status != IoStatus::Ok)
                    return status;
            }
        }

        IoStatus WriteAll(Connection &conn, const std::string &data,
                          SteadyClock::time_point deadline, const std::atomic<bool> &cancelled)
        {
            std::size_t off = 0;
            while (off < data.size())
            {
                short waitFor = POLLOUT;
                if (conn.ssl)
                {
                    int n = SSL_write(conn.ssl, data.data() + off, static_cast<int>(data.size() - off));
                    if (n > 0)
                    {
                        off += static_cast<std::size_t>(n);
                        continue;
                    }
                    int err = SSL_get_error(conn.ssl, n);
                    if (err == SSL_ERROR_WANT_READ)
                        waitFor = POLLIN;
                    else if (err != SSL_ERROR_WANT_WRITE)
                        return IoStatus::Failed;
                }
                else
                {
                    ssize_t n = send(conn.fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
                    if (n > 0)
                    {
                        off += static_cast<std::size_t>(n);
                        continue;
                    }
                    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                        return IoStatus::Failed;
                }

                IoStatus status = WaitFd(conn.fd, waitFor, deadline, cancelled);
                if (status != IoStatus::Ok)
                    return status;
            }
            return IoStatus::Ok;
        }

        IoStatus ReadSome(Connection &conn, std::string &out,
                          SteadyClock::time_point deadline, const std::atomic<bool> &cancelled)
        {
            char buf[4096];
            while (true)
            {
                short waitFor = POLLIN;
                if (conn.ssl)
                {
                    int n = SSL_read(conn.ssl, buf, sizeof(buf));
                    if (n > 0)
                    {
                        out.append(buf, static_cast<std::size_t>(n));
                        return IoStatus::Ok;
                    }
                    int err = SSL_get_error(conn.ssl, n);
                    if (err == SSL_ERROR_ZERO_RETURN)
                        return IoStatus::Eof;
                    // Embedded servers often drop the socket without close_notify.
                    if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)
                        return IoStatus::Eof;
                    if (err == SSL_ERROR_WANT_WRITE)
                        waitFor = POLLOUT;
                    else if (err != SSL_ERROR_WANT_READ)
                        return IoStatus::Failed;
                }
                else
                {
                    ssize_t n = recv(conn.fd, buf, sizeof(buf), 0);
                    if (n > 0)
                    {
                        out.append(buf, static_cast<std::size_t>(n));
                        return IoStatus::Ok;
                    }
                    if (n == 0)
                        return IoStatus::Eof;
                    if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                        return IoStatus::Failed;
                }

                IoStatus status = WaitFd(conn.fd, waitFor, deadline, cancelled);
                if (status != IoStatus::Ok)
                    return status;
            }
        }

        std::string Lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        std::string TrimSpaces(const std::string &s)
        {
            std::size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string::npos)
                return "";
            std::size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        // Header block only; lower-case names.
        std::map<std::string, std::string> ParseHeaderBlock(const std::string &block)
        {
            std::map<std::string, std::string> headers;
            std::istringstream stream(block);
            std::string line;
            std::getline(stream, line);
            while (std::getline(stream, line))
            {
                const std::size_t colon = line.find(':');
                if (colon == std::string::npos)
                    continue;
                headers[Lower(TrimSpaces(line.substr(0, colon)))] = TrimSpaces(line.substr(colon + 1));
            }
            return headers;
        }

        bool DecodeChunked(const std::string &body, std::string &out, bool &complete)
        {
            out.clear();
            complete = false;
            std::size_t pos = 0;
            while (pos < body.size())
            {
                const std::size_t lineEnd = body.find("\r\n", pos);
                if (lineEnd == std::string::npos)
                    return true;

                std::string sizeText = body.substr(pos, lineEnd - pos);
                const std::size_t ext = sizeText.find(';');
                if (ext != std::string::npos)
                    sizeText = sizeText.substr(0, ext);
                sizeText = TrimSpaces(sizeText);
                if (sizeText.empty() || !std::all_of(sizeText.begin(), sizeText.end(),
                                                     [](unsigned char c)
                                                     { return std::isxdigit(c) != 0; }))
                    return false;

                const unsigned long size = std::stoul(sizeText, nullptr, 16);
                if (size == 0)
                {
                    complete = true;
                    return true;
                }

                const std::size_t dataStart = lineEnd + 2;
                if (dataStart + size + 2 > body.size())
                    return true;
                out.append(body, dataStart, size);
                pos = dataStart + size + 2;
            }
            return true;
        }
    }

    SocketHttpTransport::SocketHttpTransport(std::string host, int port, bool useTls)
        : m_host(std::move(host)), m_port(port), m_useTls(useTls), m_sslCtx(nullptr)
    {
        if (m_useTls)
            InitSSL();
    }

    SocketHttpTransport::~SocketHttpTransport()
    {
        CleanupSSL();
    }

    void SocketHttpTransport::InitSSL()
    {
        SSL_load_error_strings();
        OpenSSL_add_ssl_algorithms();

        m_sslCtx = SSL_CTX_new(TLS_client_method());
        if (!m_sslCtx)
            throw std::runtime_error("Cannot create TLS context: " + SslErrorString());

        // Switch consoles ship self-signed certificates.
        SSL_CTX_set_verify(m_sslCtx, SSL_VERIFY_NONE, nullptr);
    }

    void SocketHttpTransport::CleanupSSL()
    {
        if (m_sslCtx)
        {
            SSL_CTX_free(m_sslCtx);
            m_sslCtx = nullptr;
        }
    }

    void SocketHttpTransport::Cancel()
    {
        m_cancelled.store(true);
    }

    void SocketHttpTransport::Resume()
    {
        m_cancelled.store(false);
    }

    std::string SocketHttpTransport::Describe() const
    {
        return std::string(m_useTls ? "https://" : "http://") + m_host + ":" + std::to_string(m_port);
    }

    std::string SocketHttpTransport::BuildRequest(const HttpRequest &request) const
    {
        const bool defaultPort = (m_useTls && m_port == 443) || (!m_useTls && m_port == 80);
        const std::string hostHeader = defaultPort ? m_host : m_host + ":" + std::to_string(m_port);

        std::ostringstream out;
        out << ToString(request.method) << " " << (request.path.empty() ? "/" : request.path) << " HTTP/1.1\r\n";
        out << "Host: " << hostHeader << "\r\n";
        out << "User-Agent: SwitchWatch/1.0\r\n";
        out << "Accept: */*\r\n";
        out << "Referer: " << (m_useTls ? "https://" : "http://") << hostHeader << "/\r\n";
        out << "Connection: close\r\n";
        if (!request.cookie.empty())
            out << "Cookie: " << request.cookie << "\r\n";
        if (request.method == HttpMethod::Post)
        {
            out << "Content-Type: " << request.content_type << "\r\n";
            out << "Content-Length: " << request.body.size() << "\r\n";
        }
        out << "\r\n";
        if (request.method == HttpMethod::Post)
            out << request.body;
        return out.str();
    }

    bool SocketHttpTransport::IsComplete(const std::string &raw)
    {
        const std::size_t headerEnd = raw.find("\r\n\r\n");
        if (headerEnd == std::string::npos)
            return false;

        const auto headers = ParseHeaderBlock(raw.substr(0, headerEnd));
        const std::string body = raw.substr(headerEnd + 4);

        auto te = headers.find("transfer-encoding");
        if (te != headers.end() && Lower(te->second).find("chunked") != std::string::npos)
        {
            std::string decoded;
            bool complete = false;
            try
            {
                return DecodeChunked(body, decoded, complete) && complete;
            }
            catch (const std::exception &)
            {
                return false;
            }
        }

        auto cl = headers.find("content-length");
        if (cl != headers.end())
        {
            try
            {
                return body.size() >= std::stoul(cl->second);
            }
            catch (const std::exception &)
            {
                return false;
            }
        }
        return false;
    }

    HttpResponse SocketHttpTransport::ParseResponse(const std::string &raw)
    {
        HttpResponse response;

        const std::size_t headerEnd = raw.find("\r\n\r\n");
        const std::size_t lineEnd = raw.find("\r\n");
        if (headerEnd == std::string::npos || lineEnd == std::string::npos || raw.compare(0, 5, "HTTP/") != 0)
        {
            response.error = {TransportErrorKind::MalformedResponse, "missing status line or header terminator"};
            return response;
        }

        std::istringstream statusLine(raw.substr(0, lineEnd));
        std::string version;
        statusLine >> version >> response.status_code;
        if (!statusLine || response.status_code < 100 || response.status_code > 599)
        {
            response.status_code = 0;
            response.error = {TransportErrorKind::MalformedResponse, "bad status line"};
            return response;
        }

        const std::string headerBlock = raw.substr(0, headerEnd);
        std::istringstream stream(headerBlock);
        std::string line;
        std::getline(stream, line);
        while (std::getline(stream, line))
        {
            const std::size_t colon = line.find(':');
            if (colon == std::string::npos)
                continue;
            const std::string name = Lower(TrimSpaces(line.substr(0, colon)));
            const std::string value = TrimSpaces(line.substr(colon + 1));
            if (name == "set-cookie")
                response.set_cookies.push_back(value);

            auto it = response.headers.find(name);
            if (it == response.headers.end())
                response.headers[name] = value;
            else
                it->second += ", " + value;
        }

        std::string body = raw.substr(headerEnd + 4);
        auto te = response.headers.find("transfer-encoding");
        if (te != response.headers.end() && Lower(te->second).find("chunked") != std::string::npos)
        {
            std::string decoded;
            bool complete = false;
            try
            {
                if (!DecodeChunked(body, decoded, complete) || !complete)
                {
                    response.error = {TransportErrorKind::MalformedResponse, "truncated chunked body"};
                    return response;
                }
            }
            catch (const std::exception &e)
            {
                response.error = {TransportErrorKind::MalformedResponse, std::string("bad chunk size: ") + e.what()};
                return response;
            }
            body = std::move(decoded);
        }
        else if (auto cl = response.headers.find("content-length"); cl != response.headers.end())
        {
            try
            {
                const std::size_t length = std::stoul(cl->second);
                if (body.size() < length)
                {
                    response.error = {TransportErrorKind::MalformedResponse, "truncated body"};
                    return response;
                }
                body.resize(length);
            }
            catch (const std::exception &)
            {
                response.error = {TransportErrorKind::MalformedResponse, "bad Content-Length"};
                return response;
            }
        }

        response.body = std::move(body);
        response.success = true;
        return response;
    }

    HttpResponse SocketHttpTransport::Send(const HttpRequest &request, std::chrono::milliseconds timeout)
    {
        HttpResponse failed;
        const auto deadline = SteadyClock::now() + timeout;
        const std::string what = std::string(ToString(request.method)) + " " + request.path;

        if (m_cancelled.load())
        {
            failed.error = {TransportErrorKind::Cancelled, what + " cancelled"};
            return failed;
        }

        Connection conn;
        std::string error;
        IoStatus status = ConnectTcp(conn, m_host, m_port, deadline, m_cancelled, error);
        if (status != IoStatus::Ok)
        {
            failed.error = ToError(status, what);
            if (status == IoStatus::Failed)
                failed.error.message = error;
            return failed;
        }

        if (m_useTls)
        {
            status = ConnectTls(conn, m_sslCtx, m_host, deadline, m_cancelled, error);
            if (status != IoStatus::Ok)
            {
                failed.error = ToError(status, what);
                if (status == IoStatus::Failed)
                    failed.error.message = error;
                return failed;
            }
        }

        status = WriteAll(conn, BuildRequest(request), deadline, m_cancelled);
        if (status != IoStatus::Ok)
        {
            failed.error = ToError(status, what + " write");
            return failed;
        }

        std::string raw;
        while (!IsComplete(raw))
        {
            status = ReadSome(conn, raw, deadline, m_cancelled);
            if (status == IoStatus::Eof)
                break;
            if (status != IoStatus::Ok)
            {
                failed.error = ToError(status, what + " read");
                return failed;
            }
            if (raw.size() > MAX_RESPONSE_BYTES)
            {
                failed.error = {TransportErrorKind::MalformedResponse, what + ": response too large"};
                return failed;
            }
        }

        if (raw.empty())
        {
            failed.error = {TransportErrorKind::MalformedResponse, what + ": empty response"};
            return failed;
        }

        HttpResponse response = ParseResponse(raw);
        if (!response.success)
            std::cerr << "[Http] " << Describe() << " " << what << ": " << response.error.message << "\n";
        return response;
    }
}
