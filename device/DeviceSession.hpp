#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "HttpTransport.hpp"
#include "../common/Types.hpp"
#include "../common/Endpoints.hpp"

namespace switch_watch::device
{
    enum class AuthErrorKind
    {
        None,
        Unreachable,
        Timeout,
        Rejected,
        Cancelled
    };

    struct AuthError
    {
        AuthErrorKind kind = AuthErrorKind::None;
        std::string message;
    };

    struct LoginResult
    {
        bool success = false;
        common::SessionState session;
        AuthError error;
    };

    struct ExecuteResult
    {
        bool success = false;
        std::string body;
        int status_code = 0;
        std::chrono::milliseconds latency{0};
        TransportError error;
    };

    enum class SessionPhase
    {
        LoggedOut,
        Authenticating,
        Authenticated,
        SessionExpired
    };

    struct SessionOptions
    {
        std::chrono::milliseconds connection_test_timeout = protocol::CONNECTION_TEST_TIMEOUT;
        std::chrono::milliseconds login_timeout = protocol::LOGIN_TIMEOUT;
        std::chrono::milliseconds operation_timeout = protocol::OPERATION_TIMEOUT;
        std::chrono::seconds session_lifetime = protocol::SESSION_LIFETIME;
    };

    const char *ToString(AuthErrorKind kind);
    TransportError ToTransportError(const AuthError &error);
    const char *ToString(SessionPhase phase);

    // One authenticated conversation with one switch. Login and Execute are
    // serialized by a per-session mutex, so at most one request (including the
    // internal re-login retry) is in flight at a time.
    class DeviceSession
    {
    public:
        DeviceSession(std::string host, std::shared_ptr<HttpTransport> transport, SessionOptions options = {});
        ~DeviceSession();

        DeviceSession(const DeviceSession &) = delete;
        DeviceSession &operator=(const DeviceSession &) = delete;

        LoginResult Login(const std::string &username, const std::string &password);
        LoginResult Login(const std::string &username, const std::string &password, std::chrono::milliseconds timeout);

        // Logs in again with the stored credentials.
        LoginResult Relogin();

        ExecuteResult Execute(const std::string &endpoint, HttpMethod method = HttpMethod::Get, const std::string &body = "");
        ExecuteResult Execute(const std::string &endpoint, HttpMethod method, const std::string &body,
                              std::chrono::milliseconds timeout);

        // Reachability only; never touches session state.
        bool TestConnection();
        bool TestConnection(std::chrono::milliseconds timeout);

        void Logout();

        void Cancel();
        void Resume();

        common::SessionState GetSessionState() const;
        SessionPhase GetPhase() const;
        bool IsAuthenticated() const;
        bool HasCredentials() const;

        const std::string &Host() const { return m_host; }
        const SessionOptions &Options() const { return m_options; }

    private:
        struct Credentials
        {
            std::string username;
            std::string password;
        };

        std::string m_host;
        std::shared_ptr<HttpTransport> m_transport;
        SessionOptions m_options;

        mutable std::mutex m_mutex;
        common::SessionState m_state;
        SessionPhase m_phase = SessionPhase::LoggedOut;
        std::optional<Credentials> m_credentials;

        LoginResult LoginLocked(std::chrono::milliseconds timeout);
        HttpResponse SendLocked(const std::string &path, HttpMethod method, const std::string &body,
                                std::chrono::milliseconds timeout);
        void ClearStateLocked();
        void WipeCredentialsLocked();
    };
}
