#include "copypasta/client/http_transport.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "copypasta/errors.hpp"

namespace copypasta::client
{

    namespace
    {
        class CurlCategory : public std::error_category
        {
        public:
            const char *name() const noexcept override { return "curl"; }

            std::string message(int value) const override
            {
                return curl_easy_strerror(static_cast<CURLcode>(value));
            }
        };

        std::error_code make_curl_error(CURLcode code)
        {
            return {static_cast<int>(code), curl_category()};
        }

        void ensure_curl_global_init()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                               if (const auto code = curl_global_init(CURL_GLOBAL_DEFAULT); code != CURLE_OK)
                               {
                                   throw PastaError::request_error("curl_global_init", make_curl_error(code));
                               } });
        }

        std::string_view trim_line(std::string_view line)
        {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n' || line.back() == ' '))
            {
                line.remove_suffix(1);
            }
            while (!line.empty() && (line.front() == ' ' || line.front() == '\t'))
            {
                line.remove_prefix(1);
            }
            return line;
        }

        std::size_t write_body(char *data, std::size_t size, std::size_t count, void *userdata)
        {
            auto *body = static_cast<std::string *>(userdata);
            body->append(data, size * count);
            return size * count;
        }

        // Called once per header line. A new status line (after a 1xx
        // interim response) discards what was collected so far.
        std::size_t write_header(char *data, std::size_t size, std::size_t count, void *userdata)
        {
            auto *response = static_cast<http::Response *>(userdata);
            const auto line = trim_line(std::string_view(data, size * count));
            if (line.starts_with("HTTP/"))
            {
                response->headers.clear();
                response->reason.clear();
                const auto code_begin = line.find(' ');
                if (code_begin != std::string_view::npos && line.size() > code_begin + 5)
                {
                    response->reason = std::string(line.substr(code_begin + 5));
                }
            }
            else if (const auto colon = line.find(':'); colon != std::string_view::npos)
            {
                response->headers.push_back(http::Header{std::string(trim_line(line.substr(0, colon))),
                                                         std::string(trim_line(line.substr(colon + 1)))});
            }
            return size * count;
        }

        using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

    } // namespace

    const std::error_category &curl_category() noexcept
    {
        static const CurlCategory category;
        return category;
    }

    CurlHttpTransport::CurlHttpTransport(Logger logger)
        : logger_(std::move(logger)) {}

    http::Response CurlHttpTransport::send(const http::Endpoint &endpoint, const http::Request &request)
    {
        const auto context = request.method + " " + endpoint.authority() + request.target;
        ensure_curl_global_init();

        EasyHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl)
        {
            throw PastaError::request_error(context + ": curl_easy_init failed");
        }

        HeaderList headers(nullptr, &curl_slist_free_all);
        const auto append_header = [&](const std::string &line)
        {
            auto *appended = curl_slist_append(headers.get(), line.c_str());
            if (appended == nullptr)
            {
                throw PastaError::request_error(context + ": curl_slist_append failed");
            }
            headers.release();
            headers.reset(appended);
        };
        for (const auto &header : request.headers)
        {
            append_header(header.name + ": " + header.value);
        }
        // An empty Expect header stops curl from waiting on 100-continue.
        append_header("Expect:");

        const auto url = endpoint.scheme + "://" + endpoint.authority() + request.target;
        http::Response response;

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty())
        {
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, write_header);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

        const auto code = curl_easy_perform(curl.get());
        if (code != CURLE_OK)
        {
            logger_.log("http", context, " transport error: ", curl_easy_strerror(code));
            throw PastaError::request_error(context, make_curl_error(code));
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<int>(status);

        logger_.log("http", context, " -> ", response.status, " (", response.body.size(), " bytes)");
        return response;
    }

} // namespace copypasta::client
