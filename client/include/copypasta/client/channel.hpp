#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "copypasta/channel_protocol.hpp"
#include "copypasta/client/config.hpp"
#include "copypasta/client/logger.hpp"
#include "copypasta/errors.hpp"
#include "copypasta/http.hpp"
#include "copypasta/websocket.hpp"

namespace copypasta::client
{

    // A joined topic. Owned by exactly one transfer loop at a time.
    class ChannelTopic
    {
    public:
        virtual ~ChannelTopic() = default;

        virtual const std::string &name() const = 0;

        // Fire-and-forget; no acknowledgement beyond transport delivery.
        virtual void send(std::string_view event, const nlohmann::json &payload) = 0;

        // Blocks for the next event in arrival order. Returns std::nullopt
        // once the topic or its connection has closed. Throws
        // PastaError(FatalProtocolError) when the topic was torn down because
        // the peer broke the protocol.
        virtual std::optional<protocol::ChannelEvent> next_event() = 0;
    };

    class TopicSubscription;

    // Channel socket over a client WebSocket. Socket reads, heartbeats and
    // writes run on an internal I/O thread; inbound events are handed to each
    // topic through a bounded queue so the transfer loop never stalls them.
    class ChannelConnection
    {
        struct Passkey
        {
            explicit Passkey() = default;
        };

    public:
        static std::unique_ptr<ChannelConnection> connect(const std::string &url, const std::string &token,
                                                          ChannelOptions options, Logger logger);

        // Only reachable through connect().
        ChannelConnection(Passkey, ChannelOptions options, Logger logger);
        ChannelConnection(const ChannelConnection &) = delete;
        ChannelConnection &operator=(const ChannelConnection &) = delete;
        ~ChannelConnection();

        // Blocks until the server acknowledges the join. Throws
        // PastaError(RequestError) on rejection, timeout or connection loss.
        std::unique_ptr<ChannelTopic> join(const std::string &topic);

        // Thread-safe. Dropped silently once the connection is closed.
        void publish(const protocol::Message &message);

        std::string next_ref();

        // Sends a close frame, shuts the socket down and joins the I/O thread.
        void close();

        bool is_open() const noexcept { return open_; }

    private:
        void handshake(const http::Url &url);
        void start();
        void read_next();
        void on_read(const std::error_code &ec, std::size_t bytes_transferred);
        void process_pending();
        void handle_frame(websocket::Frame frame);
        void handle_message(const std::string &text);
        void dispatch(protocol::Message message);
        void forget_topic(const std::string &topic);
        void schedule_heartbeat();
        void enqueue_frame(std::vector<std::uint8_t> frame);
        void write_next();
        void begin_close();
        void shutdown_socket();
        void finish(const std::optional<PastaError> &failure, const std::string &reason);

        ChannelOptions options_;
        Logger logger_;
        asio::io_context io_context_;
        asio::ip::tcp::socket socket_;
        asio::steady_timer heartbeat_timer_;
        std::thread io_thread_;
        std::string endpoint_label_;

        // I/O thread only.
        std::array<std::uint8_t, 64 * 1024> read_chunk_{};
        std::vector<std::uint8_t> pending_;
        websocket::MessageAssembler assembler_;
        std::deque<std::vector<std::uint8_t>> outbox_;
        bool writing_{false};
        bool closing_{false};
        bool socket_closed_{false};

        std::atomic<bool> open_{false};
        std::atomic<std::uint64_t> ref_counter_{0};
        std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<TopicSubscription>> topics_;
        std::unordered_map<std::string, std::promise<protocol::JoinReply>> pending_joins_;
    };

} // namespace copypasta::client
