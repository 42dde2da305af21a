#include "copypasta/client/api_session.hpp"

#include <utility>

#include "copypasta/errors.hpp"
#include "copypasta/version.hpp"

namespace copypasta::client
{

    namespace
    {
        constexpr int kStatusOk = 200;
        constexpr int kStatusForbidden = 403;

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }
    } // namespace

    ApiSession::ApiSession(HttpTransport &transport, http::Endpoint endpoint, Logger logger)
        : transport_(transport),
          endpoint_(std::move(endpoint)),
          logger_(std::move(logger)) {}

    void ApiSession::set_credentials(Credentials credentials)
    {
        if (!credentials.host.empty())
        {
            endpoint_ = http::parse_endpoint(credentials.host);
        }
        credentials_ = std::move(credentials);
    }

    AuthResult ApiSession::authenticate()
    {
        const auto response = send("GET", "/api");
        if (response.status == kStatusForbidden)
        {
            auto challenge = parse_body<protocol::LoginResponse>(response, "GET /api");
            logger_.log("auth", "token missing or rejected, login url ", challenge.login_url);
            return AuthChallenge{std::move(challenge.login_url)};
        }
        check_response(response, "GET /api");
        auto user = parse_body<protocol::UserInfo>(response, "GET /api");
        logger_.log("auth", "authenticated as ", user.username);
        return user;
    }

    protocol::UserInfo ApiSession::complete_login(std::string token, std::string host)
    {
        set_credentials(Credentials{std::move(token), std::move(host)});
        auto result = authenticate();
        if (auto *challenge = std::get_if<AuthChallenge>(&result))
        {
            throw PastaError::auth_challenge(std::move(challenge->login_url));
        }
        return std::get<protocol::UserInfo>(std::move(result));
    }

    std::string ApiSession::create_stream()
    {
        const auto response = send("GET", "/api/stream");
        check_response(response, "GET /api/stream");
        auto stream = parse_body<protocol::CreateStreamResponse>(response, "GET /api/stream");
        logger_.log("stream", "server allocated stream ", stream.name);
        return stream.name;
    }

    std::string ApiSession::get_socket_url() const
    {
        const std::string scheme = endpoint_.scheme == "https" ? "wss" : "ws";
        http::Endpoint socket_endpoint{scheme, endpoint_.host, endpoint_.port};
        if (endpoint_.port == http::default_port(endpoint_.scheme))
        {
            socket_endpoint.port = http::default_port(scheme);
        }
        return scheme + "://" + socket_endpoint.authority() + "/socket/websocket";
    }

    protocol::Pasta ApiSession::latest()
    {
        const auto response = send("GET", "/api/latest");
        check_response(response, "GET /api/latest");
        return parse_body<protocol::Pasta>(response, "GET /api/latest");
    }

    std::vector<protocol::Pasta> ApiSession::list()
    {
        const auto response = send("GET", "/api/list");
        check_response(response, "GET /api/list");
        return parse_body<std::vector<protocol::Pasta>>(response, "GET /api/list");
    }

    void ApiSession::create(std::string content)
    {
        const auto body = nlohmann::json(protocol::CreatePasta{std::move(content)}).dump();
        const auto response = send("POST", "/api/create", body);
        check_response(response, "POST /api/create");
    }

    http::Response ApiSession::send(std::string method, std::string target, std::string body)
    {
        http::Request request;
        request.method = std::move(method);
        request.target = std::move(target);
        request.headers = {
            {"Host", endpoint_.authority()},
            {"User-Agent", "copypasta/" + std::string(version())},
            {"Accept", "application/json"},
            {"Connection", "close"},
        };
        if (credentials_)
        {
            request.headers.push_back({"Authorization", "Bearer " + credentials_->token});
        }
        if (!body.empty())
        {
            request.headers.push_back({"Content-Type", "application/json"});
            request.body = std::move(body);
        }
        return transport_.send(endpoint_, request);
    }

    void ApiSession::check_response(const http::Response &response, std::string_view context) const
    {
        if (response.status == kStatusOk)
        {
            return;
        }
        if (response.status == kStatusForbidden)
        {
            auto challenge = parse_body<protocol::LoginResponse>(response, context);
            throw PastaError::auth_challenge(std::move(challenge.login_url));
        }
        throw PastaError::server_error(response.status, context);
    }

    template <typename T>
    T ApiSession::parse_body(const http::Response &response, std::string_view context) const
    {
        try
        {
            return nlohmann::json::parse(response.body).get<T>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw PastaError::request_error(std::string(context) + ": unexpected response body (" + ex.what() + ")");
        }
    }

    std::string to_host_string(const http::Endpoint &endpoint)
    {
        if (endpoint.scheme == "http")
        {
            return endpoint.authority();
        }
        return endpoint.scheme + "://" + endpoint.authority();
    }

    LoginOutcome ensure_logged_in(ApiSession &session, const CredentialStore &store, const TokenPrompt &prompt)
    {
        auto result = session.authenticate();
        if (auto *user = std::get_if<protocol::UserInfo>(&result))
        {
            return LoginOutcome{std::move(*user), false};
        }

        const auto login_url = std::get<AuthChallenge>(result).login_url;
        const auto token = trim(prompt(login_url));
        if (token.empty())
        {
            throw PastaError::auth_challenge(login_url);
        }

        auto user = session.complete_login(token, to_host_string(session.endpoint()));
        store.save(*session.credentials());
        return LoginOutcome{std::move(user), true};
    }

} // namespace copypasta::client
