#include "gtest/gtest.h"
#include "device/DeviceSession.hpp"
#include "device/SocketHttpTransport.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <memory>
#include <string>
#include <thread>

using namespace switch_watch::device;

namespace
{
    // Accepts one connection on 127.0.0.1, reads the request headers and answers with `reply`.
    class LoopbackServer
    {
    public:
        explicit LoopbackServer(std::string reply) : m_reply(std::move(reply))
        {
            m_fd = socket(AF_INET, SOCK_STREAM, 0);
            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            bind(m_fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
            listen(m_fd, 1);

            socklen_t len = sizeof(addr);
            getsockname(m_fd, reinterpret_cast<sockaddr *>(&addr), &len);
            m_port = ntohs(addr.sin_port);

            m_thread = std::thread([this]
                                   { Serve(); });
        }

        ~LoopbackServer()
        {
            if (m_thread.joinable())
                m_thread.join();
            close(m_fd);
        }

        int Port() const { return m_port; }

        // Valid after the exchange finished.
        std::string Request()
        {
            if (m_thread.joinable())
                m_thread.join();
            return m_request;
        }

    private:
        void Serve()
        {
            int client = accept(m_fd, nullptr, nullptr);
            if (client < 0)
                return;

            char buffer[4096];
            while (m_request.find("\r\n\r\n") == std::string::npos)
            {
                ssize_t n = recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0)
                    break;
                m_request.append(buffer, static_cast<std::size_t>(n));
            }
            send(client, m_reply.data(), m_reply.size(), MSG_NOSIGNAL);
            close(client);
        }

        std::string m_reply;
        std::string m_request;
        int m_fd = -1;
        int m_port = 0;
        std::thread m_thread;
    };

    // A loopback port nothing listens on.
    int ClosedPort()
    {
        int fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
        close(fd);
        return ntohs(addr.sin_port);
    }
}

TEST(HttpTransportTest, ParsesHeadersCookiesAndBody)
{
    const HttpResponse response = SocketHttpTransport::ParseResponse(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/html\r\n"
        "Set-Cookie: SessionID=abc; Path=/\r\n"
        "Set-Cookie: lang=en\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello trailing");

    ASSERT_TRUE(response.success);
    EXPECT_TRUE(response.IsOk());
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body, "hello");
    EXPECT_EQ(response.Header("CONTENT-TYPE").value_or(""), "text/html");
    EXPECT_EQ(response.Cookie("SessionID").value_or(""), "abc");
    EXPECT_EQ(response.Cookie("lang").value_or(""), "en");
    EXPECT_FALSE(response.Cookie("missing").has_value());
}

TEST(HttpTransportTest, DecodesChunkedBody)
{
    const std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\nhello\r\n"
        "6\r\n world\r\n"
        "0\r\n\r\n";

    EXPECT_TRUE(SocketHttpTransport::IsComplete(raw));
    const HttpResponse response = SocketHttpTransport::ParseResponse(raw);
    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.body, "hello world");
}

TEST(HttpTransportTest, RejectsMalformedResponses)
{
    const HttpResponse garbage = SocketHttpTransport::ParseResponse("garbage");
    EXPECT_FALSE(garbage.success);
    EXPECT_EQ(garbage.error.kind, TransportErrorKind::MalformedResponse);

    const HttpResponse truncated = SocketHttpTransport::ParseResponse(
        "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort");
    EXPECT_FALSE(truncated.success);
    EXPECT_EQ(truncated.error.kind, TransportErrorKind::MalformedResponse);

    const HttpResponse badStatus = SocketHttpTransport::ParseResponse("HTTP/1.1 abc OK\r\n\r\n");
    EXPECT_FALSE(badStatus.success);
}

TEST(HttpTransportTest, NonSuccessStatusIsNotOk)
{
    const HttpResponse response = SocketHttpTransport::ParseResponse(
        "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");

    EXPECT_TRUE(response.success);
    EXPECT_FALSE(response.IsOk());
    EXPECT_EQ(response.status_code, 404);
}

TEST(HttpTransportTest, CompletenessFollowsFraming)
{
    EXPECT_FALSE(SocketHttpTransport::IsComplete("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n"));
    EXPECT_FALSE(SocketHttpTransport::IsComplete("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nab"));
    EXPECT_TRUE(SocketHttpTransport::IsComplete("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nabcd"));
    EXPECT_FALSE(SocketHttpTransport::IsComplete("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n5\r\nhel"));
    EXPECT_FALSE(SocketHttpTransport::IsComplete("HTTP/1.1 200 OK\r\nContent-Length: x\r\n\r\nab"));
}

TEST(HttpTransportTest, FormEncoding)
{
    EXPECT_EQ(EncodeForm({{"username", "admin"}, {"password", "p@ss word"}}),
              "username=admin&password=p%40ss+word");
    EXPECT_EQ(UrlEncode("3^"), "3%5E");
    EXPECT_EQ(UrlEncode("a-b_c.d~"), "a-b_c.d~");
}

TEST(HttpTransportTest, BuildsPostWithCookieAndLength)
{
    SocketHttpTransport transport("192.168.0.1", 80, false);
    HttpRequest request;
    request.method = HttpMethod::Post;
    request.path = "/logon.cgi";
    request.body = "username=admin";
    request.cookie = "SessionID=abc";

    const std::string raw = transport.BuildRequest(request);
    EXPECT_EQ(raw.rfind("POST /logon.cgi HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(raw.find("Host: 192.168.0.1\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Cookie: SessionID=abc\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Content-Length: 14\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(raw.substr(raw.size() - 14), "username=admin");
}

TEST(HttpTransportTest, HostHeaderCarriesNonDefaultPort)
{
    SocketHttpTransport transport("switch.local", 8080, false);
    HttpRequest request;
    const std::string raw = transport.BuildRequest(request);

    EXPECT_EQ(raw.rfind("GET / HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(raw.find("Host: switch.local:8080\r\n"), std::string::npos);
    EXPECT_EQ(raw.find("Content-Length"), std::string::npos);
}

TEST(HttpTransportTest, ExchangesOverLoopback)
{
    LoopbackServer server("HTTP/1.1 200 OK\r\nContent-Length: 7\r\nSet-Cookie: SessionID=xyz\r\n\r\nwelcome");
    SocketHttpTransport transport("127.0.0.1", server.Port(), false);

    HttpRequest request;
    request.path = "/SystemInfoRpm.htm";
    request.cookie = "SessionID=old";
    const HttpResponse response = transport.Send(request, std::chrono::seconds(5));

    ASSERT_TRUE(response.success) << response.error.message;
    EXPECT_EQ(response.body, "welcome");
    EXPECT_EQ(response.Cookie("SessionID").value_or(""), "xyz");

    const std::string seen = server.Request();
    EXPECT_EQ(seen.rfind("GET /SystemInfoRpm.htm HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(seen.find("Cookie: SessionID=old\r\n"), std::string::npos);
}

TEST(HttpTransportTest, ReadsUntilEofWithoutContentLength)
{
    LoopbackServer server("HTTP/1.0 200 OK\r\n\r\nbody until close");
    SocketHttpTransport transport("127.0.0.1", server.Port(), false);

    const HttpResponse response = transport.Send(HttpRequest{}, std::chrono::seconds(5));
    ASSERT_TRUE(response.success) << response.error.message;
    EXPECT_EQ(response.body, "body until close");
}

TEST(HttpTransportTest, ClosedPortFailsConnectionTest)
{
    auto transport = std::make_shared<SocketHttpTransport>("127.0.0.1", ClosedPort(), false);
    DeviceSession session("127.0.0.1", transport);

    EXPECT_FALSE(session.TestConnection(std::chrono::milliseconds(500)));
    EXPECT_FALSE(session.IsAuthenticated());

    const HttpResponse response = transport->Send(HttpRequest{}, std::chrono::milliseconds(500));
    EXPECT_FALSE(response.success);
    EXPECT_NE(response.error.kind, TransportErrorKind::None);
}

TEST(HttpTransportTest, CancelledTransportFailsFast)
{
    SocketHttpTransport transport("127.0.0.1", ClosedPort(), false);
    transport.Cancel();

    const HttpResponse response = transport.Send(HttpRequest{}, std::chrono::seconds(5));
    EXPECT_EQ(response.error.kind, TransportErrorKind::Cancelled);

    transport.Resume();
    EXPECT_NE(transport.Send(HttpRequest{}, std::chrono::milliseconds(500)).error.kind, TransportErrorKind::Cancelled);
}
