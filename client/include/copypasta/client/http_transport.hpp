#pragma once

#include <system_error>

#include "copypasta/client/logger.hpp"
#include "copypasta/http.hpp"

namespace copypasta::client
{

    class HttpTransport
    {
    public:
        virtual ~HttpTransport() = default;

        // Throws PastaError(RequestError) on any transport-level failure.
        virtual http::Response send(const http::Endpoint &endpoint, const http::Request &request) = 0;
    };

    // Error category for CURLcode values; message() is curl_easy_strerror.
    const std::error_category &curl_category() noexcept;

    // One libcurl easy handle per request. Redirects are not followed.
    class CurlHttpTransport : public HttpTransport
    {
    public:
        explicit CurlHttpTransport(Logger logger);

        http::Response send(const http::Endpoint &endpoint, const http::Request &request) override;

    private:
        Logger logger_;
    };

} // namespace copypasta::client
