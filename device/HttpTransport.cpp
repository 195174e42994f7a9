#include "HttpTransport.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace switch_watch::device
{
    std::optional<std::string> HttpResponse::Header(const std::string &name) const
    {
        std::string key = name;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        auto it = headers.find(key);
        if (it == headers.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<std::string> HttpResponse::Cookie(const std::string &name) const
    {
        const std::string prefix = name + "=";
        for (const auto &line : set_cookies)
        {
            std::size_t start = 0;
            while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start])))
                ++start;
            if (line.compare(start, prefix.size(), prefix) != 0)
                continue;

            const std::size_t valueStart = start + prefix.size();
            const std::size_t end = line.find(';', valueStart);
            return line.substr(valueStart, end == std::string::npos ? std::string::npos : end - valueStart);
        }
        return std::nullopt;
    }

    std::string UrlEncode(const std::string &value)
    {
        std::ostringstream out;
        out << std::hex << std::uppercase;
        for (unsigned char c : value)
        {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
                out << c;
            else if (c == ' ')
                out << '+';
            else
                out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
        return out.str();
    }

    std::string EncodeForm(const FormFields &fields)
    {
        std::string body;
        for (const auto &[key, value] : fields)
        {
            if (!body.empty())
                body += '&';
            body += UrlEncode(key);
            body += '=';
            body += UrlEncode(value);
        }
        return body;
    }

    const char *ToString(HttpMethod method)
    {
        return method == HttpMethod::Post ? "POST" : "GET";
    }

    const char *ToString(TransportErrorKind kind)
    {
        switch (kind)
        {
        case TransportErrorKind::None:
            return "none";
        case TransportErrorKind::Unreachable:
            return "unreachable";
        case TransportErrorKind::Timeout:
            return "timeout";
        case TransportErrorKind::MalformedResponse:
            return "malformed response";
        case TransportErrorKind::HttpStatus:
            return "http status";
        case TransportErrorKind::SessionExpired:
            return "session expired";
        case TransportErrorKind::AuthFailed:
            return "authentication failed";
        case TransportErrorKind::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }
}
