#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace copypasta::client
{

    enum class CommandKind : std::uint8_t
    {
        Default,
        Login,
        List,
        Produce,
        Consume
    };

    struct ChannelOptions
    {
        std::chrono::seconds heartbeat_interval{30};
        std::chrono::seconds join_timeout{10};
        std::size_t event_queue_capacity{64};
    };

    struct ClientConfig
    {
        CommandKind command{CommandKind::Default};
        std::optional<std::string> stream_name;
        std::filesystem::path config_path;
        std::optional<std::string> host;
        std::optional<std::filesystem::path> log_path;
        bool verbose{};
        bool show_help{};
        bool show_version{};
        ChannelOptions channel{};
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::filesystem::path default_config_path();

    std::string usage();

} // namespace copypasta::client
