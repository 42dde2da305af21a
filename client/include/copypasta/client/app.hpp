#pragma once

#include <cstddef>
#include <string>

#include "copypasta/client/api_session.hpp"
#include "copypasta/client/config.hpp"
#include "copypasta/client/credential_store.hpp"
#include "copypasta/client/http_transport.hpp"
#include "copypasta/client/logger.hpp"
#include "copypasta/client/transfer.hpp"

namespace copypasta::client
{

    class ClientApp
    {
    public:
        ClientApp(ClientConfig config, Logger logger);

        int run();

    private:
        int dispatch();
        int handle_login();
        int handle_list();
        int handle_produce();
        int handle_consume();
        int handle_default();

        bool load_credentials();
        protocol::UserInfo login();
        void report(const TransferSummary &summary, const std::string &verb) const;
        static std::string prompt_token(const std::string &login_url);
        static std::size_t terminal_width();

        ClientConfig config_;
        Logger logger_;
        CredentialStore store_;
        CurlHttpTransport transport_;
        ApiSession session_;
    };

    // One listing line: zero-padded id, then the content with newlines shown
    // as "\n" and tabs as spaces, cut to fit the width.
    std::string format_list_line(const protocol::Pasta &pasta, std::size_t width);

} // namespace copypasta::client
