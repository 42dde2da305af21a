/**
 * Copypasta - Endpoint parsing and the HTTP/1.1 head codec used by the WebSocket upgrade.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace copypasta::http
{

    struct Header
    {
        std::string name;
        std::string value;
    };

    struct Request
    {
        std::string method{"GET"};
        std::string target{"/"};
        std::vector<Header> headers{};
        std::string body{};
    };

    struct Response
    {
        int status{};
        std::string reason{};
        std::vector<Header> headers{};
        std::string body{};

        // Case-insensitive lookup of the first header with this name.
        std::optional<std::string> header(std::string_view name) const;
    };

    struct ResponseHead
    {
        Response response;
        std::size_t header_bytes{};
    };

    // Scheme, host and port of a server. Text form: [scheme://]host[:port].
    struct Endpoint
    {
        std::string scheme{"http"};
        std::string host{"localhost"};
        std::uint16_t port{4000};

        // host[:port], omitting the port when it is the scheme default.
        std::string authority() const;
    };

    struct Url
    {
        Endpoint endpoint;
        std::string target{"/"};
    };

    std::uint16_t default_port(std::string_view scheme) noexcept;

    Endpoint parse_endpoint(std::string_view text);

    Url parse_url(std::string_view text);

    std::string percent_encode(std::string_view value);

    bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

    std::string serialize_request(const Request &request);

    // Parses the status line and headers once the blank line has arrived.
    std::optional<ResponseHead> try_parse_response_head(std::string_view buffer);

} // namespace copypasta::http
