/**
 * Copypasta - Error kinds raised by the session, channel and transfer layers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace copypasta
{

    enum class ErrorKind : std::uint8_t
    {
        NoConfigFound,
        AuthChallenge,
        ServerError,
        RequestError,
        FatalProtocolError
    };

    std::string_view to_string(ErrorKind kind) noexcept;

    // Carries the originating HTTP status, login URL or I/O cause so the CLI
    // can render a precise diagnostic.
    class PastaError : public std::runtime_error
    {
    public:
        PastaError(ErrorKind kind, const std::string &message);

        static PastaError no_config_found(const std::string &path);
        static PastaError auth_challenge(std::string login_url);
        static PastaError server_error(int status, std::string_view context);
        static PastaError request_error(const std::string &context, std::error_code cause = {});
        static PastaError protocol_error(const std::string &detail);

        ErrorKind kind() const noexcept { return kind_; }
        std::optional<int> status() const noexcept { return status_; }
        const std::string &login_url() const noexcept { return login_url_; }
        std::error_code cause() const noexcept { return cause_; }

    private:
        ErrorKind kind_;
        std::optional<int> status_;
        std::string login_url_;
        std::error_code cause_;
    };

} // namespace copypasta
