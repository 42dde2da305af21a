#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "copypasta/client/credential_store.hpp"
#include "copypasta/client/http_transport.hpp"
#include "copypasta/client/logger.hpp"
#include "copypasta/http.hpp"
#include "copypasta/protocol.hpp"

namespace copypasta::client
{

    struct AuthChallenge
    {
        std::string login_url;
    };

    using AuthResult = std::variant<protocol::UserInfo, AuthChallenge>;

    // Authenticated access to the REST API. With credentials installed every
    // request carries "Authorization: Bearer <token>"; without, none does.
    class ApiSession
    {
    public:
        ApiSession(HttpTransport &transport, http::Endpoint endpoint, Logger logger);

        // Also switches the endpoint to credentials.host when it is set.
        void set_credentials(Credentials credentials);

        const std::optional<Credentials> &credentials() const noexcept { return credentials_; }
        const http::Endpoint &endpoint() const noexcept { return endpoint_; }

        AuthResult authenticate();

        // Installs the pair and re-authenticates. The pair stays installed
        // when this throws.
        protocol::UserInfo complete_login(std::string token, std::string host);

        std::string create_stream();

        std::string get_socket_url() const;

        protocol::Pasta latest();

        std::vector<protocol::Pasta> list();

        void create(std::string content);

    private:
        http::Response send(std::string method, std::string target, std::string body = {});
        void check_response(const http::Response &response, std::string_view context) const;
        template <typename T>
        T parse_body(const http::Response &response, std::string_view context) const;

        HttpTransport &transport_;
        http::Endpoint endpoint_;
        Logger logger_;
        std::optional<Credentials> credentials_;
    };

    std::string to_host_string(const http::Endpoint &endpoint);

    // Receives the login URL, returns the token the user pasted.
    using TokenPrompt = std::function<std::string(const std::string &login_url)>;

    struct LoginOutcome
    {
        protocol::UserInfo user;
        bool credentials_updated{};
    };

    // Authenticates, and on a challenge prompts for a token, completes the
    // login and persists the new credentials.
    LoginOutcome ensure_logged_in(ApiSession &session, const CredentialStore &store, const TokenPrompt &prompt);

} // namespace copypasta::client
