#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace switch_watch::device
{
    enum class HttpMethod
    {
        Get,
        Post
    };

    enum class TransportErrorKind
    {
        None,
        Unreachable,
        Timeout,
        MalformedResponse,
        HttpStatus,
        SessionExpired,
        AuthFailed,
        Cancelled
    };

    struct TransportError
    {
        TransportErrorKind kind = TransportErrorKind::None;
        std::string message;
    };

    struct HttpRequest
    {
        HttpMethod method = HttpMethod::Get;
        std::string path = "/";
        std::string body;
        std::string cookie;
        std::string content_type = "application/x-www-form-urlencoded";
    };

    struct HttpResponse
    {
        bool success = false;
        int status_code = 0;
        std::string body;
        // Header names are stored lower-case; repeated headers are joined with ", ".
        std::map<std::string, std::string> headers;
        std::vector<std::string> set_cookies;
        TransportError error;

        bool IsOk() const { return success && status_code >= 200 && status_code < 300; }
        std::optional<std::string> Header(const std::string &name) const;
        std::optional<std::string> Cookie(const std::string &name) const;
    };

    using FormFields = std::vector<std::pair<std::string, std::string>>;

    std::string UrlEncode(const std::string &value);
    std::string EncodeForm(const FormFields &fields);

    const char *ToString(HttpMethod method);
    const char *ToString(TransportErrorKind kind);

    // One request/response exchange with the device. Implementations must be
    // safe to Cancel from another thread while Send is blocked.
    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        virtual HttpResponse Send(const HttpRequest &request, std::chrono::milliseconds timeout) = 0;

        // Aborts the in-flight Send and fails new ones with Cancelled until Resume.
        virtual void Cancel() = 0;
        virtual void Resume() = 0;

        virtual std::string Describe() const = 0;
    };
}
