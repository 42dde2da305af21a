#include "copypasta/http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

#include "copypasta/errors.hpp"

namespace copypasta::http
{

    namespace
    {
        constexpr std::string_view kLineEnd = "\r\n";
        constexpr std::string_view kHeadEnd = "\r\n\r\n";

        std::string_view trim(std::string_view value)
        {
            const auto begin = value.find_first_not_of(" \t");
            if (begin == std::string_view::npos)
            {
                return {};
            }
            const auto end = value.find_last_not_of(" \t");
            return value.substr(begin, end - begin + 1);
        }

        PastaError malformed(const std::string &detail)
        {
            return PastaError::request_error("malformed HTTP response: " + detail);
        }

        std::uint16_t parse_port(std::string_view text)
        {
            unsigned value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0 || value > 65535)
            {
                throw std::invalid_argument("Invalid port: " + std::string(text));
            }
            return static_cast<std::uint16_t>(value);
        }

    } // namespace

    std::optional<std::string> Response::header(std::string_view name) const
    {
        for (const auto &entry : headers)
        {
            if (iequals(entry.name, name))
            {
                return entry.value;
            }
        }
        return std::nullopt;
    }

    std::string Endpoint::authority() const
    {
        if (port == default_port(scheme))
        {
            return host;
        }
        return host + ":" + std::to_string(port);
    }

    std::uint16_t default_port(std::string_view scheme) noexcept
    {
        if (scheme == "https" || scheme == "wss")
        {
            return 443;
        }
        return 80;
    }

    Endpoint parse_endpoint(std::string_view text)
    {
        Endpoint endpoint;
        auto rest = trim(text);
        if (const auto separator = rest.find("://"); separator != std::string_view::npos)
        {
            endpoint.scheme = std::string(rest.substr(0, separator));
            std::transform(endpoint.scheme.begin(), endpoint.scheme.end(), endpoint.scheme.begin(),
                           [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            rest = rest.substr(separator + 3);
        }
        if (endpoint.scheme != "http" && endpoint.scheme != "https" && endpoint.scheme != "ws" &&
            endpoint.scheme != "wss")
        {
            throw std::invalid_argument("Unsupported scheme: " + endpoint.scheme);
        }
        if (const auto slash = rest.find('/'); slash != std::string_view::npos)
        {
            rest = rest.substr(0, slash);
        }
        if (rest.empty())
        {
            throw std::invalid_argument("Missing host in endpoint: " + std::string(text));
        }
        const auto colon = rest.rfind(':');
        if (colon != std::string_view::npos && rest.find(']', colon) == std::string_view::npos)
        {
            endpoint.host = std::string(rest.substr(0, colon));
            endpoint.port = parse_port(rest.substr(colon + 1));
        }
        else
        {
            endpoint.host = std::string(rest);
            endpoint.port = default_port(endpoint.scheme);
        }
        if (endpoint.host.empty())
        {
            throw std::invalid_argument("Missing host in endpoint: " + std::string(text));
        }
        return endpoint;
    }

    Url parse_url(std::string_view text)
    {
        const auto trimmed = trim(text);
        const auto scheme_end = trimmed.find("://");
        if (scheme_end == std::string_view::npos)
        {
            throw std::invalid_argument("URL without scheme: " + std::string(text));
        }
        Url url;
        const auto path_begin = trimmed.find('/', scheme_end + 3);
        url.endpoint = parse_endpoint(trimmed.substr(0, path_begin));
        if (path_begin != std::string_view::npos)
        {
            url.target = std::string(trimmed.substr(path_begin));
        }
        return url;
    }

    std::string percent_encode(std::string_view value)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size());
        for (const char ch : value)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            {
                encoded.push_back(ch);
            }
            else
            {
                encoded.push_back('%');
                encoded.push_back(kHexDigits[(c >> 4) & 0x0F]);
                encoded.push_back(kHexDigits[c & 0x0F]);
            }
        }
        return encoded;
    }

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept
    {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

    std::string serialize_request(const Request &request)
    {
        std::string text;
        text.reserve(256 + request.body.size());
        text.append(request.method).append(" ").append(request.target).append(" HTTP/1.1\r\n");
        for (const auto &header : request.headers)
        {
            text.append(header.name).append(": ").append(header.value).append(kLineEnd);
        }
        if (!request.body.empty())
        {
            text.append("Content-Length: ").append(std::to_string(request.body.size())).append(kLineEnd);
        }
        text.append(kLineEnd);
        text.append(request.body);
        return text;
    }

    std::optional<ResponseHead> try_parse_response_head(std::string_view buffer)
    {
        const auto head_end = buffer.find(kHeadEnd);
        if (head_end == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto head = buffer.substr(0, head_end);
        const auto status_end = head.find(kLineEnd);
        const auto status_line = head.substr(0, status_end);

        if (status_line.substr(0, 5) != "HTTP/")
        {
            throw malformed("missing status line");
        }
        const auto first_space = status_line.find(' ');
        if (first_space == std::string_view::npos)
        {
            throw malformed("missing status code");
        }
        const auto code_text = status_line.substr(first_space + 1, 3);
        ResponseHead result;
        const auto [ptr, ec] =
            std::from_chars(code_text.data(), code_text.data() + code_text.size(), result.response.status);
        if (ec != std::errc{} || ptr != code_text.data() + code_text.size())
        {
            throw malformed("invalid status code");
        }
        if (status_line.size() > first_space + 5)
        {
            result.response.reason = std::string(status_line.substr(first_space + 5));
        }

        std::size_t position = status_end == std::string_view::npos ? head.size() : status_end + kLineEnd.size();
        while (position < head.size())
        {
            auto line_end = head.find(kLineEnd, position);
            if (line_end == std::string_view::npos)
            {
                line_end = head.size();
            }
            const auto line = head.substr(position, line_end - position);
            const auto colon = line.find(':');
            if (colon == std::string_view::npos)
            {
                throw malformed("header without colon");
            }
            result.response.headers.push_back(
                Header{std::string(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1)))});
            position = line_end + kLineEnd.size();
        }
        result.header_bytes = head_end + kHeadEnd.size();
        return result;
    }

} // namespace copypasta::http
