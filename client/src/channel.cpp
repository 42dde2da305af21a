#include "copypasta/client/channel.hpp"

#include <asio/connect.hpp>
#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <exception>
#include <span>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "copypasta/client/blocking_queue.hpp"

namespace copypasta::client
{

    class TopicSubscription
    {
    public:
        explicit TopicSubscription(std::size_t capacity)
            : queue_(capacity) {}

        bool deliver(protocol::ChannelEvent event)
        {
            return queue_.try_push(std::move(event));
        }

        void finish(const std::optional<PastaError> &failure)
        {
            {
                std::lock_guard lock(mutex_);
                if (failure && !failure_)
                {
                    failure_ = failure;
                }
            }
            queue_.close();
        }

        bool finished() const
        {
            return queue_.closed();
        }

        std::optional<protocol::ChannelEvent> next()
        {
            auto event = queue_.pop();
            if (!event)
            {
                std::lock_guard lock(mutex_);
                if (failure_)
                {
                    throw *failure_;
                }
            }
            return event;
        }

    private:
        BlockingQueue<protocol::ChannelEvent> queue_;
        std::mutex mutex_;
        std::optional<PastaError> failure_;
    };

    namespace
    {
        constexpr std::string_view kHeadEnd = "\r\n\r\n";

        std::span<const std::uint8_t> as_bytes(const std::string &text)
        {
            return {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()};
        }

        class RemoteTopic : public ChannelTopic
        {
        public:
            RemoteTopic(ChannelConnection &connection, std::string name, std::string join_ref,
                        std::shared_ptr<TopicSubscription> subscription)
                : connection_(connection),
                  name_(std::move(name)),
                  join_ref_(std::move(join_ref)),
                  subscription_(std::move(subscription)) {}

            const std::string &name() const override { return name_; }

            void send(std::string_view event, const nlohmann::json &payload) override
            {
                connection_.publish(protocol::Message{
                    .topic = name_,
                    .event = std::string(event),
                    .payload = payload,
                    .ref = connection_.next_ref(),
                    .join_ref = join_ref_,
                });
            }

            std::optional<protocol::ChannelEvent> next_event() override
            {
                return subscription_->next();
            }

        private:
            ChannelConnection &connection_;
            std::string name_;
            std::string join_ref_;
            std::shared_ptr<TopicSubscription> subscription_;
        };

    } // namespace

    ChannelConnection::ChannelConnection(Passkey, ChannelOptions options, Logger logger)
        : options_(options),
          logger_(std::move(logger)),
          socket_(io_context_),
          heartbeat_timer_(io_context_) {}

    ChannelConnection::~ChannelConnection()
    {
        close();
    }

    std::unique_ptr<ChannelConnection> ChannelConnection::connect(const std::string &url, const std::string &token,
                                                                  ChannelOptions options, Logger logger)
    {
        http::Url parsed;
        try
        {
            parsed = http::parse_url(url);
        }
        catch (const std::invalid_argument &ex)
        {
            throw PastaError::request_error("invalid channel URL " + url + ": " + ex.what());
        }
        if (parsed.endpoint.scheme != "ws")
        {
            throw PastaError::request_error("channel URL " + url + ": scheme " + parsed.endpoint.scheme +
                                            " is not supported");
        }
        parsed.target += parsed.target.find('?') == std::string::npos ? '?' : '&';
        parsed.target += "token=" + http::percent_encode(token) + "&vsn=" + std::string(protocol::kSocketVersion);

        auto connection = std::make_unique<ChannelConnection>(Passkey{}, options, std::move(logger));
        connection->handshake(parsed);
        connection->start();
        return connection;
    }

    void ChannelConnection::handshake(const http::Url &url)
    {
        endpoint_label_ = url.endpoint.authority();
        try
        {
            asio::ip::tcp::resolver resolver(io_context_);
            const auto results = resolver.resolve(url.endpoint.host, std::to_string(url.endpoint.port));
            asio::connect(socket_, results);
            socket_.set_option(asio::ip::tcp::no_delay(true));

            const auto key = websocket::make_handshake_key();
            const auto request = http::serialize_request(websocket::make_handshake_request(url, key));
            asio::write(socket_, asio::buffer(request));

            std::string head;
            asio::read_until(socket_, asio::dynamic_buffer(head), kHeadEnd);
            const auto parsed = http::try_parse_response_head(head);
            if (!parsed)
            {
                throw PastaError::request_error("websocket upgrade response from " + endpoint_label_ + " is incomplete");
            }
            websocket::verify_handshake_response(parsed->response, key);
            pending_.assign(head.begin() + static_cast<std::ptrdiff_t>(parsed->header_bytes), head.end());
        }
        catch (const std::system_error &ex)
        {
            throw PastaError::request_error("websocket connect to " + endpoint_label_, ex.code());
        }
        logger_.log("channel", "connected to ", endpoint_label_);
    }

    void ChannelConnection::start()
    {
        open_ = true;
        asio::post(io_context_, [this]
                   {
                       try
                       {
                           process_pending();
                       }
                       catch (const PastaError &error)
                       {
                           finish(error, error.what());
                           shutdown_socket();
                           return;
                       }
                       if (open_)
                       {
                           read_next();
                       } });
        schedule_heartbeat();
        io_thread_ = std::thread([this]
                                 { io_context_.run(); });
    }

    std::string ChannelConnection::next_ref()
    {
        return std::to_string(++ref_counter_);
    }

    std::unique_ptr<ChannelTopic> ChannelConnection::join(const std::string &topic)
    {
        auto subscription = std::make_shared<TopicSubscription>(options_.event_queue_capacity);
        const auto ref = next_ref();
        std::promise<protocol::JoinReply> promise;
        auto reply_future = promise.get_future();
        {
            std::lock_guard lock(mutex_);
            if (!open_)
            {
                throw PastaError::request_error("cannot join " + topic + ": channel connection is closed");
            }
            topics_[topic] = subscription;
            pending_joins_[ref] = std::move(promise);
        }

        logger_.log("channel", "joining ", topic);
        publish(protocol::Message{
            .topic = topic,
            .event = std::string(protocol::to_string(protocol::EventKind::Join)),
            .payload = nlohmann::json::object(),
            .ref = ref,
            .join_ref = ref,
        });

        if (reply_future.wait_for(options_.join_timeout) != std::future_status::ready)
        {
            {
                std::lock_guard lock(mutex_);
                pending_joins_.erase(ref);
            }
            forget_topic(topic);
            throw PastaError::request_error("timed out joining " + topic);
        }

        const auto reply = reply_future.get();
        if (!reply.ok)
        {
            forget_topic(topic);
            throw PastaError::request_error("server rejected join of " + topic + ": " + reply.response.dump());
        }
        logger_.log("channel", "joined ", topic);
        return std::make_unique<RemoteTopic>(*this, topic, ref, std::move(subscription));
    }

    void ChannelConnection::publish(const protocol::Message &message)
    {
        if (!open_)
        {
            logger_.log("channel", "dropping ", message.event, " on ", message.topic, ": connection closed");
            return;
        }
        const auto text = nlohmann::json(message).dump();
        enqueue_frame(websocket::encode_client_frame(websocket::Opcode::Text, as_bytes(text)));
    }

    void ChannelConnection::close()
    {
        if (!io_thread_.joinable())
        {
            return;
        }
        asio::post(io_context_, [this]
                   { begin_close(); });
        if (std::this_thread::get_id() != io_thread_.get_id())
        {
            io_thread_.join();
        }
    }

    void ChannelConnection::read_next()
    {
        socket_.async_read_some(asio::buffer(read_chunk_), [this](const std::error_code &ec, std::size_t bytes_transferred)
                                { on_read(ec, bytes_transferred); });
    }

    void ChannelConnection::on_read(const std::error_code &ec, std::size_t bytes_transferred)
    {
        if (ec)
        {
            if (closing_ || ec == asio::error::operation_aborted)
            {
                finish(std::nullopt, "connection closed");
            }
            else
            {
                finish(std::nullopt, "connection lost: " + ec.message());
            }
            shutdown_socket();
            return;
        }

        pending_.insert(pending_.end(), read_chunk_.begin(),
                        read_chunk_.begin() + static_cast<std::ptrdiff_t>(bytes_transferred));
        try
        {
            process_pending();
        }
        catch (const PastaError &error)
        {
            finish(error, error.what());
            shutdown_socket();
            return;
        }
        if (!socket_closed_)
        {
            read_next();
        }
    }

    void ChannelConnection::process_pending()
    {
        std::size_t offset = 0;
        while (!socket_closed_)
        {
            auto decoded = websocket::try_decode_frame(std::span<const std::uint8_t>(pending_).subspan(offset));
            if (!decoded)
            {
                break;
            }
            offset += decoded->bytes_consumed;
            handle_frame(std::move(decoded->frame));
        }
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
    }

    void ChannelConnection::handle_frame(websocket::Frame frame)
    {
        switch (frame.opcode)
        {
        case websocket::Opcode::Ping:
            enqueue_frame(websocket::encode_client_frame(websocket::Opcode::Pong, frame.payload));
            return;
        case websocket::Opcode::Pong:
            return;
        case websocket::Opcode::Close:
            logger_.log("channel", "server closed the connection");
            begin_close();
            return;
        default:
            break;
        }
        if (auto message = assembler_.push(frame))
        {
            handle_message(*message);
        }
    }

    void ChannelConnection::handle_message(const std::string &text)
    {
        try
        {
            dispatch(nlohmann::json::parse(text).get<protocol::Message>());
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw PastaError::protocol_error(std::string("malformed channel message: ") + ex.what());
        }
    }

    void ChannelConnection::dispatch(protocol::Message message)
    {
        if (message.topic == protocol::kPhoenixTopic)
        {
            return;
        }

        const auto kind = protocol::event_kind_from_string(message.event);
        std::shared_ptr<TopicSubscription> subscription;
        {
            std::lock_guard lock(mutex_);
            if (kind == protocol::EventKind::Reply && message.ref)
            {
                if (auto join = pending_joins_.find(*message.ref); join != pending_joins_.end())
                {
                    join->second.set_value(protocol::parse_reply(message.payload));
                    pending_joins_.erase(join);
                    return;
                }
            }
            auto it = topics_.find(message.topic);
            if (it == topics_.end())
            {
                logger_.log("channel", "ignoring ", message.event, " for unjoined topic ", message.topic);
                return;
            }
            subscription = it->second;
        }

        const auto topic = message.topic;
        if (!subscription->deliver(protocol::to_event(message)))
        {
            if (!subscription->finished())
            {
                logger_.log("channel", "event queue for ", topic, " overflowed");
                subscription->finish(PastaError::protocol_error("event queue for " + topic +
                                                                " overflowed; the peer ignored flow control"));
            }
            forget_topic(topic);
            return;
        }
        if (kind == protocol::EventKind::Error || kind == protocol::EventKind::Close)
        {
            logger_.log("channel", "server sent ", message.event, " on ", topic);
            subscription->finish(std::nullopt);
            forget_topic(topic);
        }
    }

    void ChannelConnection::forget_topic(const std::string &topic)
    {
        std::lock_guard lock(mutex_);
        topics_.erase(topic);
    }

    void ChannelConnection::schedule_heartbeat()
    {
        heartbeat_timer_.expires_after(options_.heartbeat_interval);
        heartbeat_timer_.async_wait([this](const std::error_code &ec)
                                    {
                                        if (ec || !open_ || closing_)
                                        {
                                            return;
                                        }
                                        publish(protocol::Message{
                                            .topic = std::string(protocol::kPhoenixTopic),
                                            .event = std::string(protocol::to_string(protocol::EventKind::Heartbeat)),
                                            .payload = nlohmann::json::object(),
                                            .ref = next_ref(),
                                            .join_ref = std::nullopt,
                                        });
                                        schedule_heartbeat(); });
    }

    void ChannelConnection::enqueue_frame(std::vector<std::uint8_t> frame)
    {
        asio::post(io_context_, [this, frame = std::move(frame)]() mutable
                   {
                       if (socket_closed_ || closing_)
                       {
                           return;
                       }
                       outbox_.push_back(std::move(frame));
                       if (!writing_)
                       {
                           write_next();
                       } });
    }

    void ChannelConnection::write_next()
    {
        writing_ = true;
        asio::async_write(socket_, asio::buffer(outbox_.front()), [this](const std::error_code &ec, std::size_t)
                          {
                              writing_ = false;
                              if (ec)
                              {
                                  if (ec != asio::error::operation_aborted)
                                  {
                                      finish(std::nullopt, "write failed: " + ec.message());
                                      shutdown_socket();
                                  }
                                  return;
                              }
                              outbox_.pop_front();
                              if (!outbox_.empty())
                              {
                                  write_next();
                              }
                              else if (closing_)
                              {
                                  shutdown_socket();
                              } });
    }

    void ChannelConnection::begin_close()
    {
        if (closing_ || socket_closed_)
        {
            return;
        }
        closing_ = true;
        heartbeat_timer_.cancel();
        const std::array<std::uint8_t, 2> normal_closure{0x03, 0xE8};
        outbox_.push_back(websocket::encode_client_frame(websocket::Opcode::Close, normal_closure));
        if (!writing_)
        {
            write_next();
        }
    }

    void ChannelConnection::shutdown_socket()
    {
        if (socket_closed_)
        {
            return;
        }
        socket_closed_ = true;
        outbox_.clear();
        heartbeat_timer_.cancel();
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    void ChannelConnection::finish(const std::optional<PastaError> &failure, const std::string &reason)
    {
        if (!open_.exchange(false))
        {
            return;
        }
        heartbeat_timer_.cancel();

        std::unordered_map<std::string, std::shared_ptr<TopicSubscription>> topics;
        std::unordered_map<std::string, std::promise<protocol::JoinReply>> joins;
        {
            std::lock_guard lock(mutex_);
            topics.swap(topics_);
            joins.swap(pending_joins_);
        }
        for (auto &[ref, promise] : joins)
        {
            const auto error = failure ? *failure
                                       : PastaError::request_error("channel connection closed before the join was "
                                                                   "acknowledged (" +
                                                                   reason + ")");
            promise.set_exception(std::make_exception_ptr(error));
        }
        for (auto &[topic, subscription] : topics)
        {
            subscription->finish(failure);
        }
        logger_.log("channel", endpoint_label_, ": ", reason);
    }

} // namespace copypasta::client
