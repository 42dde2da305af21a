#include "copypasta/client/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace copypasta::client
{

    namespace
    {
        constexpr const char *kConfigFileName = ".pastaconfig";

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }
    } // namespace

    std::filesystem::path default_config_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / kConfigFileName;
        }
        return std::filesystem::path(kConfigFileName);
    }

    std::string usage()
    {
        return "Usage: copypasta [options] [login | list | produce | consume <name>]\n"
               "\n"
               "Without a command, prints your latest pasta when stdin is a terminal\n"
               "and stores stdin as a new pasta otherwise.\n"
               "\n"
               "Commands:\n"
               "  login                     Log in to Copypasta\n"
               "  list                      List your pastas\n"
               "  produce                   Stream stdin through your account\n"
               "  consume <name>            Write a stream created by a Copypasta user to stdout\n"
               "\n"
               "Options:\n"
               "  -c, --config <file>       Credential file (default ~/.pastaconfig)\n"
               "  --host <[scheme://]host[:port]>  Server to talk to\n"
               "  --log <file>              Append logs to file\n"
               "  -v, --verbose             Log to stderr\n"
               "  -h, --help                Show this help\n"
               "  --version                 Show the client version\n";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;
        config.config_path = default_config_path();

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "-c" || arg == "--config")
            {
                config.config_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--host")
            {
                config.host = require_value(index, argc, argv, arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "-v" || arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "-h" || arg == "--help")
            {
                config.show_help = true;
            }
            else if (arg == "--version")
            {
                config.show_version = true;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown option: " + arg);
            }
            else if (config.command != CommandKind::Default)
            {
                throw std::runtime_error("Unexpected argument: " + arg);
            }
            else if (arg == "login")
            {
                config.command = CommandKind::Login;
            }
            else if (arg == "list")
            {
                config.command = CommandKind::List;
            }
            else if (arg == "produce")
            {
                config.command = CommandKind::Produce;
            }
            else if (arg == "consume")
            {
                config.command = CommandKind::Consume;
                config.stream_name = require_value(index, argc, argv, arg);
            }
            else
            {
                throw std::runtime_error("Unknown command: " + arg);
            }
        }

        return config;
    }

} // namespace copypasta::client
