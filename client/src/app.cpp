#include "copypasta/client/app.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <charconv>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "copypasta/channel_protocol.hpp"
#include "copypasta/client/channel.hpp"
#include "copypasta/errors.hpp"

namespace copypasta::client
{

    namespace
    {
        constexpr std::size_t kDefaultWidth = 80;
        constexpr std::size_t kIdColumns = 6;

        std::string replace_all(std::string text, std::string_view from, std::string_view to)
        {
            std::size_t position = 0;
            while ((position = text.find(from, position)) != std::string::npos)
            {
                text.replace(position, from.size(), to);
                position += to.size();
            }
            return text;
        }

        // Byte length of the first max_chars UTF-8 characters.
        std::size_t utf8_prefix_bytes(const std::string &text, std::size_t max_chars)
        {
            std::size_t chars = 0;
            for (std::size_t i = 0; i < text.size(); ++i)
            {
                if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80)
                {
                    if (chars == max_chars)
                    {
                        return i;
                    }
                    ++chars;
                }
            }
            return text.size();
        }

        http::Endpoint initial_endpoint(const ClientConfig &config)
        {
            if (!config.host)
            {
                return http::Endpoint{};
            }
            try
            {
                return http::parse_endpoint(*config.host);
            }
            catch (const std::invalid_argument &ex)
            {
                throw std::runtime_error(std::string("--host: ") + ex.what());
            }
        }
    } // namespace

    std::string format_list_line(const protocol::Pasta &pasta, std::size_t width)
    {
        auto content = replace_all(replace_all(pasta.content, "\n", "\\n"), "\t", " ");
        const auto available = width > kIdColumns ? width - kIdColumns : 0;
        content.resize(utf8_prefix_bytes(content, available));

        std::ostringstream line;
        line << std::setw(5) << std::setfill('0') << pasta.id << ' ' << content;
        return line.str();
    }

    ClientApp::ClientApp(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          store_(config_.config_path),
          transport_(logger_),
          session_(transport_, initial_endpoint(config_), logger_) {}

    int ClientApp::run()
    {
        try
        {
            return dispatch();
        }
        catch (const PastaError &error)
        {
            std::cerr << "error: " << to_string(error.kind()) << ": " << error.what() << std::endl;
            logger_.log("error", to_string(error.kind()), ": ", error.what());
        }
        catch (const std::exception &ex)
        {
            std::cerr << "error: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
        }
        return 1;
    }

    int ClientApp::dispatch()
    {
        if (!load_credentials())
        {
            if (config_.command == CommandKind::Login)
            {
                return handle_login();
            }
            std::cerr << "You are not logged in. Run `copypasta login` first." << std::endl;
            return 1;
        }

        const auto user = login();
        logger_.log("info", "running as ", user.username);

        switch (config_.command)
        {
        case CommandKind::Login:
            std::cerr << "You are already logged in" << std::endl;
            return 0;
        case CommandKind::List:
            return handle_list();
        case CommandKind::Produce:
            return handle_produce();
        case CommandKind::Consume:
            return handle_consume();
        case CommandKind::Default:
            break;
        }
        return handle_default();
    }

    bool ClientApp::load_credentials()
    {
        auto credentials = store_.try_load();
        if (!credentials)
        {
            logger_.log("config", "no credentials at ", store_.path().string());
            return false;
        }
        if (config_.host)
        {
            credentials->host = to_host_string(session_.endpoint());
        }
        session_.set_credentials(std::move(*credentials));
        logger_.log("config", "loaded credentials from ", store_.path().string(), " for ",
                    session_.endpoint().authority());
        return true;
    }

    protocol::UserInfo ClientApp::login()
    {
        auto outcome = ensure_logged_in(session_, store_, &ClientApp::prompt_token);
        if (outcome.credentials_updated)
        {
            std::cerr << "welcome, " << outcome.user.username << "!" << std::endl;
            logger_.log("auth", "stored new credentials in ", store_.path().string());
        }
        return outcome.user;
    }

    int ClientApp::handle_login()
    {
        login();
        std::cerr << "You are now logged in" << std::endl;
        return 0;
    }

    int ClientApp::handle_list()
    {
        const auto width = terminal_width();
        for (const auto &pasta : session_.list())
        {
            std::cout << format_list_line(pasta, width) << '\n';
        }
        std::cout.flush();
        return 0;
    }

    int ClientApp::handle_produce()
    {
        const auto name = session_.create_stream();
        std::cerr << "Streaming to " << name << std::endl;

        auto connection = ChannelConnection::connect(session_.get_socket_url(), session_.credentials()->token,
                                                     config_.channel, logger_);
        TransferSummary summary;
        {
            auto topic = connection->join(protocol::stream_topic(name));
            Producer producer(*topic, std::cin, logger_);
            summary = producer.run();
        }
        connection->close();

        if (!summary.completed)
        {
            throw PastaError::request_error("channel closed before transfer completed");
        }
        report(summary, "producing");
        if (summary.read_failed)
        {
            std::cerr << "error: reading standard input failed; the stream was ended early" << std::endl;
            return 1;
        }
        return 0;
    }

    int ClientApp::handle_consume()
    {
        const auto &name = *config_.stream_name;
        auto connection = ChannelConnection::connect(session_.get_socket_url(), session_.credentials()->token,
                                                     config_.channel, logger_);
        TransferSummary summary;
        {
            auto topic = connection->join(protocol::stream_topic(name));
            Consumer consumer(*topic, std::cout, logger_);
            summary = consumer.run();
        }
        connection->close();

        if (!summary.completed)
        {
            throw PastaError::request_error("channel closed before transfer completed");
        }
        report(summary, "consuming");
        return 0;
    }

    int ClientApp::handle_default()
    {
        if (::isatty(STDIN_FILENO))
        {
            std::cout << session_.latest().content << std::endl;
            return 0;
        }
        std::string content(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>{});
        if (std::cin.bad())
        {
            throw std::runtime_error("failed to read standard input");
        }
        session_.create(std::move(content));
        logger_.log("info", "created pasta from standard input");
        return 0;
    }

    void ClientApp::report(const TransferSummary &summary, const std::string &verb) const
    {
        std::cerr << "Done " << verb << " (" << summary.bytes << " bytes in " << summary.chunks
                  << " chunks, blake2b " << summary.digest << ")" << std::endl;
    }

    std::string ClientApp::prompt_token(const std::string &login_url)
    {
        std::cerr << "You are not logged in. Please visit this URL in a browser:\n"
                  << login_url << "\n\nThen paste the token here:" << std::endl;
        std::string token;
        if (!std::getline(std::cin, token))
        {
            throw std::runtime_error("no token entered");
        }
        return token;
    }

    std::size_t ClientApp::terminal_width()
    {
        winsize size{};
        if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) == 0 && size.ws_col > 0)
        {
            return size.ws_col;
        }
        if (const char *columns = std::getenv("COLUMNS"))
        {
            const std::string_view text(columns);
            std::size_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc{} && ptr == text.data() + text.size() && value > 0)
            {
                return value;
            }
        }
        return kDefaultWidth;
    }

} // namespace copypasta::client
