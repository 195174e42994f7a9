#include "DeviceSession.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <iostream>

namespace switch_watch::device
{
    namespace
    {
        using SteadyClock = std::chrono::steady_clock;

        bool ContainsLoginMarker(const std::string &body)
        {
            return body.find(protocol::LOGIN_MARKER) != std::string::npos;
        }

        AuthError ToAuthError(const TransportError &error)
        {
            switch (error.kind)
            {
            case TransportErrorKind::Timeout:
                return {AuthErrorKind::Timeout, error.message};
            case TransportErrorKind::Cancelled:
                return {AuthErrorKind::Cancelled, error.message};
            default:
                return {AuthErrorKind::Unreachable, error.message};
            }
        }

        void Cleanse(std::string &secret)
        {
            if (!secret.empty())
                OPENSSL_cleanse(&secret[0], secret.size());
            secret.clear();
        }
    }

    TransportError ToTransportError(const AuthError &error)
    {
        switch (error.kind)
        {
        case AuthErrorKind::Timeout:
            return {TransportErrorKind::Timeout, error.message};
        case AuthErrorKind::Cancelled:
            return {TransportErrorKind::Cancelled, error.message};
        case AuthErrorKind::Rejected:
            return {TransportErrorKind::AuthFailed, error.message};
        default:
            return {TransportErrorKind::Unreachable, error.message};
        }
    }

    const char *ToString(AuthErrorKind kind)
    {
        switch (kind)
        {
        case AuthErrorKind::None:
            return "none";
        case AuthErrorKind::Unreachable:
            return "unreachable";
        case AuthErrorKind::Timeout:
            return "timeout";
        case AuthErrorKind::Rejected:
            return "rejected";
        case AuthErrorKind::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    const char *ToString(SessionPhase phase)
    {
        switch (phase)
        {
        case SessionPhase::LoggedOut:
            return "logged out";
        case SessionPhase::Authenticating:
            return "authenticating";
        case SessionPhase::Authenticated:
            return "authenticated";
        case SessionPhase::SessionExpired:
            return "session expired";
        }
        return "unknown";
    }

    DeviceSession::DeviceSession(std::string host, std::shared_ptr<HttpTransport> transport, SessionOptions options)
        : m_host(std::move(host)), m_transport(std::move(transport)), m_options(options)
    {
    }

    DeviceSession::~DeviceSession()
    {
        Logout();

        std::lock_guard<std::mutex> lock(m_mutex);
        WipeCredentialsLocked();
    }

    LoginResult DeviceSession::Login(const std::string &username, const std::string &password)
    {
        return Login(username, password, m_options.login_timeout);
    }

    LoginResult DeviceSession::Login(const std::string &username, const std::string &password, std::chrono::milliseconds timeout)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        WipeCredentialsLocked();
        m_credentials = Credentials{username, password};
        return LoginLocked(timeout);
    }

    LoginResult DeviceSession::Relogin()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return LoginLocked(m_options.login_timeout);
    }

    HttpResponse DeviceSession::SendLocked(const std::string &path, HttpMethod method, const std::string &body,
                                           std::chrono::milliseconds timeout)
    {
        HttpRequest request;
        request.method = method;
        request.path = path;
        request.body = body;
        if (!m_state.token.empty())
            request.cookie = std::string(protocol::SESSION_COOKIE_NAME) + "=" + m_state.token;
        return m_transport->Send(request, timeout);
    }

    LoginResult DeviceSession::LoginLocked(std::chrono::milliseconds timeout)
    {
        LoginResult result;
        ClearStateLocked();

        if (!m_credentials)
        {
            result.error = {AuthErrorKind::Rejected, "no stored credentials"};
            return result;
        }

        m_phase = SessionPhase::Authenticating;
        std::cout << "[DeviceSession] Logging in to " << m_host << " as " << m_credentials->username << "\n";

        HttpResponse landing = SendLocked(protocol::endpoint::ROOT, HttpMethod::Get, "",
                                          std::min(timeout, m_options.connection_test_timeout));
        if (!landing.success)
        {
            m_phase = SessionPhase::LoggedOut;
            result.error = ToAuthError(landing.error);
            result.error.message = "Cannot connect to switch at " + m_host + ": " + landing.error.message;
            std::cerr << "[DeviceSession] " << result.error.message << "\n";
            return result;
        }
        if (auto cookie = landing.Cookie(protocol::SESSION_COOKIE_NAME))
            m_state.token = *cookie;

        if (ContainsLoginMarker(landing.body))
        {
            const std::string form = EncodeForm({{"username", m_credentials->username},
                                                 {"password", m_credentials->password},
                                                 {"logon", "Login"}});
            HttpResponse login = SendLocked(protocol::endpoint::LOGIN, HttpMethod::Post, form, timeout);
            if (!login.success)
            {
                m_phase = SessionPhase::LoggedOut;
                m_state.token.clear();
                result.error = ToAuthError(login.error);
                std::cerr << "[DeviceSession] Login request to " << m_host << " failed: " << login.error.message << "\n";
                return result;
            }
            if (auto cookie = login.Cookie(protocol::SESSION_COOKIE_NAME))
                m_state.token = *cookie;
        }

        HttpResponse verify = SendLocked(protocol::endpoint::SYSTEM_INFO, HttpMethod::Get, "", timeout);
        if (!verify.success)
        {
            m_phase = SessionPhase::LoggedOut;
            m_state.token.clear();
            result.error = ToAuthError(verify.error);
            std::cerr << "[DeviceSession] Login verification on " << m_host << " failed: " << verify.error.message << "\n";
            return result;
        }
        if (!verify.IsOk() || ContainsLoginMarker(verify.body))
        {
            m_phase = SessionPhase::LoggedOut;
            m_state.token.clear();
            result.error = {AuthErrorKind::Rejected, "Login failed - please check username and password"};
            std::cerr << "[DeviceSession] " << m_host << ": " << result.error.message << "\n";
            return result;
        }

        const auto now = common::Clock::now();
        m_state.issued_at = now;
        m_state.expires_at = now + m_options.session_lifetime;
        m_state.authenticated = true;
        m_phase = SessionPhase::Authenticated;

        std::cout << "[DeviceSession] Authenticated with " << m_host << "\n";
        result.success = true;
        result.session = m_state;
        return result;
    }

    ExecuteResult DeviceSession::Execute(const std::string &endpoint, HttpMethod method, const std::string &body)
    {
        return Execute(endpoint, method, body, m_options.operation_timeout);
    }

    ExecuteResult DeviceSession::Execute(const std::string &endpoint, HttpMethod method, const std::string &body,
                                         std::chrono::milliseconds timeout)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ExecuteResult result;
        bool reloggedIn = false;

        // A lapsed session is renewed up front; that counts as the call's one re-login.
        if (m_state.IsExpired(common::Clock::now()))
        {
            if (m_state.authenticated)
                m_phase = SessionPhase::SessionExpired;

            LoginResult login = LoginLocked(m_options.login_timeout);
            if (!login.success)
            {
                result.error = ToTransportError(login.error);
                return result;
            }
            reloggedIn = true;
        }

        while (true)
        {
            const auto started = SteadyClock::now();
            HttpResponse response = SendLocked(endpoint, method, body, timeout);
            result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started);
            result.status_code = response.status_code;

            if (!response.success)
            {
                result.error = response.error;
                return result;
            }
            if (!response.IsOk())
            {
                result.error = {TransportErrorKind::HttpStatus,
                                endpoint + " returned HTTP " + std::to_string(response.status_code)};
                return result;
            }

            if (!ContainsLoginMarker(response.body))
            {
                result.success = true;
                result.body = std::move(response.body);
                return result;
            }

            m_phase = SessionPhase::SessionExpired;
            m_state.authenticated = false;

            if (reloggedIn)
            {
                std::cerr << "[DeviceSession] " << m_host << " still requires login after re-login on " << endpoint << "\n";
                result.error = {TransportErrorKind::SessionExpired, "session expired again after re-login"};
                return result;
            }

            std::cout << "[DeviceSession] Session on " << m_host << " expired, logging in again\n";
            LoginResult login = LoginLocked(m_options.login_timeout);
            if (!login.success)
            {
                result.error = ToTransportError(login.error);
                return result;
            }
            reloggedIn = true;
        }
    }

    bool DeviceSession::TestConnection()
    {
        return TestConnection(m_options.connection_test_timeout);
    }

    bool DeviceSession::TestConnection(std::chrono::milliseconds timeout)
    {
        HttpRequest request;
        request.path = protocol::endpoint::ROOT;
        HttpResponse response = m_transport->Send(request, timeout);
        return response.IsOk();
    }

    void DeviceSession::Logout()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.authenticated)
            std::cout << "[DeviceSession] Logged out of " << m_host << "\n";
        ClearStateLocked();
    }

    void DeviceSession::Cancel()
    {
        m_transport->Cancel();
    }

    void DeviceSession::Resume()
    {
        m_transport->Resume();
    }

    common::SessionState DeviceSession::GetSessionState() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_state;
    }

    SessionPhase DeviceSession::GetPhase() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_phase;
    }

    bool DeviceSession::IsAuthenticated() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return !m_state.IsExpired(common::Clock::now());
    }

    bool DeviceSession::HasCredentials() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_credentials.has_value();
    }

    void DeviceSession::ClearStateLocked()
    {
        Cleanse(m_state.token);
        m_state = common::SessionState{};
        m_phase = SessionPhase::LoggedOut;
    }

    void DeviceSession::WipeCredentialsLocked()
    {
        if (!m_credentials)
            return;
        Cleanse(m_credentials->password);
        m_credentials.reset();
    }
}
