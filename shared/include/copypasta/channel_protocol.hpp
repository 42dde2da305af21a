/**
 * Copypasta - Channel socket message schema (Phoenix serializer V1).
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace copypasta::protocol
{

    constexpr std::string_view kPhoenixTopic = "phoenix";
    constexpr std::string_view kSocketVersion = "1.0.0";
    constexpr std::string_view kStreamTopicPrefix = "streams:";

    // Custom events of the streaming exchange.
    namespace events
    {
        constexpr std::string_view kProducerJoin = "producer_join";
        constexpr std::string_view kConsumerJoin = "consumer_join";
        constexpr std::string_view kBytesRequested = "bytes_requested";
        constexpr std::string_view kRequestBytes = "request_bytes";
        constexpr std::string_view kBytes = "bytes";
        constexpr std::string_view kDone = "done";
        constexpr std::string_view kNoMoreData = "no_more_data";
    } // namespace events

    enum class EventKind : std::uint8_t
    {
        Join,
        Leave,
        Reply,
        Error,
        Close,
        Heartbeat,
        Custom
    };

    std::string_view to_string(EventKind kind) noexcept;
    EventKind event_kind_from_string(std::string_view value) noexcept;

    struct Message
    {
        std::string topic;
        std::string event;
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> ref{};
        std::optional<std::string> join_ref{};
    };

    void to_json(nlohmann::json &json, const Message &message);
    void from_json(const nlohmann::json &json, Message &message);

    struct ChannelEvent
    {
        std::string topic;
        EventKind kind{EventKind::Custom};
        std::string name;
        nlohmann::json payload{nlohmann::json::object()};

        bool is(std::string_view custom_name) const noexcept
        {
            return kind == EventKind::Custom && name == custom_name;
        }
    };

    ChannelEvent to_event(const Message &message);

    struct JoinReply
    {
        bool ok{};
        nlohmann::json response{nlohmann::json::object()};
    };

    // Reads {"status": ..., "response": ...} out of a phx_reply payload.
    JoinReply parse_reply(const nlohmann::json &payload);

    std::string stream_topic(std::string_view stream_name);

} // namespace copypasta::protocol
