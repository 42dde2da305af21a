#include "copypasta/errors.hpp"

#include <array>
#include <utility>

namespace copypasta
{

    namespace
    {
        struct ErrorKindDescription
        {
            ErrorKind kind;
            std::string_view description;
        };

        constexpr std::array<ErrorKindDescription, 5> kDescriptions{{
            {ErrorKind::NoConfigFound, "no_config_found"},
            {ErrorKind::AuthChallenge, "auth_challenge"},
            {ErrorKind::ServerError, "server_error"},
            {ErrorKind::RequestError, "request_error"},
            {ErrorKind::FatalProtocolError, "protocol_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorKind kind) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.kind == kind)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    PastaError::PastaError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    PastaError PastaError::no_config_found(const std::string &path)
    {
        return PastaError(ErrorKind::NoConfigFound, "no credentials stored at " + path);
    }

    PastaError PastaError::auth_challenge(std::string login_url)
    {
        PastaError error(ErrorKind::AuthChallenge, "token rejected, log in at " + login_url);
        error.login_url_ = std::move(login_url);
        return error;
    }

    PastaError PastaError::server_error(int status, std::string_view context)
    {
        PastaError error(ErrorKind::ServerError,
                         std::string(context) + " failed with HTTP status " + std::to_string(status));
        error.status_ = status;
        return error;
    }

    PastaError PastaError::request_error(const std::string &context, std::error_code cause)
    {
        std::string message = context;
        if (cause)
        {
            message += ": " + cause.message();
        }
        PastaError error(ErrorKind::RequestError, message);
        error.cause_ = cause;
        return error;
    }

    PastaError PastaError::protocol_error(const std::string &detail)
    {
        return PastaError(ErrorKind::FatalProtocolError, detail);
    }

} // namespace copypasta
