#include "copypasta/channel_protocol.hpp"

#include <array>

namespace copypasta::protocol
{

    namespace
    {

        struct EventKindMapping
        {
            EventKind kind;
            std::string_view label;
        };

        constexpr std::array<EventKindMapping, 6> kEventMappings{{
            {EventKind::Join, "phx_join"},
            {EventKind::Leave, "phx_leave"},
            {EventKind::Reply, "phx_reply"},
            {EventKind::Error, "phx_error"},
            {EventKind::Close, "phx_close"},
            {EventKind::Heartbeat, "heartbeat"},
        }};

    } // namespace

    std::string_view to_string(EventKind kind) noexcept
    {
        for (const auto &mapping : kEventMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "custom";
    }

    EventKind event_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kEventMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return EventKind::Custom;
    }

    void to_json(nlohmann::json &json, const Message &message)
    {
        json = {
            {"topic", message.topic},
            {"event", message.event},
            {"payload", message.payload},
            {"ref", message.ref ? nlohmann::json(*message.ref) : nlohmann::json(nullptr)},
        };
        if (message.join_ref)
        {
            json["join_ref"] = *message.join_ref;
        }
    }

    void from_json(const nlohmann::json &json, Message &message)
    {
        message.topic = json.at("topic").get<std::string>();
        message.event = json.at("event").get<std::string>();
        message.payload = json.value("payload", nlohmann::json::object());
        message.ref.reset();
        if (auto it = json.find("ref"); it != json.end() && !it->is_null())
        {
            message.ref = it->is_string() ? it->get<std::string>() : it->dump();
        }
        message.join_ref.reset();
        if (auto it = json.find("join_ref"); it != json.end() && !it->is_null())
        {
            message.join_ref = it->is_string() ? it->get<std::string>() : it->dump();
        }
    }

    ChannelEvent to_event(const Message &message)
    {
        return ChannelEvent{
            .topic = message.topic,
            .kind = event_kind_from_string(message.event),
            .name = message.event,
            .payload = message.payload,
        };
    }

    JoinReply parse_reply(const nlohmann::json &payload)
    {
        JoinReply reply;
        if (!payload.is_object())
        {
            return reply;
        }
        const auto status = payload.find("status");
        reply.ok = status != payload.end() && status->is_string() && status->get<std::string>() == "ok";
        reply.response = payload.value("response", nlohmann::json::object());
        return reply;
    }

    std::string stream_topic(std::string_view stream_name)
    {
        std::string topic(kStreamTopicPrefix);
        topic.append(stream_name);
        return topic;
    }

} // namespace copypasta::protocol
