#include <cassert>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "copypasta/channel_protocol.hpp"
#include "copypasta/client/blocking_queue.hpp"
#include "copypasta/client/channel.hpp"
#include "copypasta/client/transfer.hpp"
#include "copypasta/crypto.hpp"
#include "copypasta/encoding/base64.hpp"
#include "copypasta/errors.hpp"

using namespace copypasta;
using namespace copypasta::client;

namespace
{

    namespace events = protocol::events;

    protocol::ChannelEvent custom(std::string_view name, nlohmann::json payload = nlohmann::json::object())
    {
        return protocol::ChannelEvent{
            .topic = "streams:test",
            .kind = protocol::EventKind::Custom,
            .name = std::string(name),
            .payload = std::move(payload),
        };
    }

    protocol::ChannelEvent bytes_event(std::string_view data)
    {
        const auto view = std::as_bytes(std::span(data.data(), data.size()));
        return custom(events::kBytes, {{"data", encoding::encode_base64(view)}});
    }

    // Feeds a fixed list of events and records everything sent, interleaved
    // with what was read, as "<event" and ">event" entries.
    class ScriptedTopic : public ChannelTopic
    {
    public:
        struct Sent
        {
            std::string event;
            nlohmann::json payload;
        };

        explicit ScriptedTopic(std::vector<protocol::ChannelEvent> script)
            : script_(script.begin(), script.end()) {}

        const std::string &name() const override { return name_; }

        void send(std::string_view event, const nlohmann::json &payload) override
        {
            sent.push_back({std::string(event), payload});
            trace.push_back(">" + std::string(event));
        }

        std::optional<protocol::ChannelEvent> next_event() override
        {
            if (script_.empty())
            {
                return std::nullopt;
            }
            auto event = std::move(script_.front());
            script_.pop_front();
            trace.push_back("<" + event.name);
            return event;
        }

        std::size_t unread() const { return script_.size(); }

        std::vector<Sent> sent;
        std::vector<std::string> trace;

    private:
        std::string name_{"streams:test"};
        std::deque<protocol::ChannelEvent> script_;
    };

    // Serves the first buffered bytes, then fails the next read.
    class FailingBuffer : public std::streambuf
    {
    public:
        explicit FailingBuffer(std::string data)
            : data_(std::move(data)) {}

    protected:
        int_type underflow() override
        {
            if (!served_)
            {
                served_ = true;
                setg(data_.data(), data_.data(), data_.data() + data_.size());
                return traits_type::to_int_type(*gptr());
            }
            throw std::runtime_error("device unplugged");
        }

    private:
        std::string data_;
        bool served_{false};
    };

    // Hands out one segment per underflow, like a pipe whose writer is
    // slower than the reader. Past the last segment it reports end of input
    // or, with fail_at_end, throws.
    class PacedBuffer : public std::streambuf
    {
    public:
        PacedBuffer(std::vector<std::string> segments, bool fail_at_end)
            : segments_(std::move(segments)), fail_at_end_(fail_at_end) {}

        std::size_t underflows() const noexcept { return next_; }

    protected:
        int_type underflow() override
        {
            if (next_ == segments_.size())
            {
                if (fail_at_end_)
                {
                    throw std::runtime_error("writer stalled");
                }
                return traits_type::eof();
            }
            auto &segment = segments_[next_++];
            setg(segment.data(), segment.data(), segment.data() + segment.size());
            return traits_type::to_int_type(*gptr());
        }

    private:
        std::vector<std::string> segments_;
        bool fail_at_end_;
        std::size_t next_{0};
    };

    std::string decoded_data(const nlohmann::json &payload)
    {
        const auto decoded = encoding::decode_base64(payload.at("data").get<std::string>());
        assert(decoded);
        return std::string(reinterpret_cast<const char *>(decoded->data()), decoded->size());
    }

    // Between two reads of "bytes_requested" the producer sends at most one
    // "bytes" event.
    bool producer_respects_pulls(const std::vector<std::string> &trace)
    {
        int credit = 0;
        for (const auto &entry : trace)
        {
            if (entry == "<bytes_requested")
            {
                credit = 1;
            }
            else if (entry == ">bytes")
            {
                if (credit == 0)
                {
                    return false;
                }
                --credit;
            }
        }
        return true;
    }

    void test_producer_empty_input()
    {
        ScriptedTopic topic({custom(events::kBytesRequested), custom(events::kBytesRequested)});
        std::istringstream input("");
        Producer producer(topic, input, Logger{});

        const auto summary = producer.run();
        assert(producer.state() == ProducerState::Done);
        assert(summary.completed);
        assert(!summary.read_failed);
        assert(summary.bytes == 0);
        assert(summary.chunks == 0);

        assert(topic.sent.size() == 2);
        assert(topic.sent[0].event == events::kProducerJoin);
        assert(topic.sent[1].event == events::kDone);
        assert(topic.sent[1].payload == nlohmann::json::object());
        assert(topic.unread() == 1);
    }

    void test_producer_chunks_large_input()
    {
        std::string data(2'500'000, '\0');
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            data[i] = static_cast<char>(i * 31 % 251);
        }
        std::istringstream input(data);

        std::vector<protocol::ChannelEvent> script(5, custom(events::kBytesRequested));
        ScriptedTopic topic(script);
        Producer producer(topic, input, Logger{});
        const auto summary = producer.run();

        assert(topic.sent.size() == 5);
        assert(topic.sent[0].event == events::kProducerJoin);
        const std::size_t expected_sizes[] = {1'000'000, 1'000'000, 500'000};
        std::string reassembled;
        for (std::size_t i = 0; i < 3; ++i)
        {
            assert(topic.sent[i + 1].event == events::kBytes);
            const auto chunk = decoded_data(topic.sent[i + 1].payload);
            assert(chunk.size() == expected_sizes[i]);
            reassembled += chunk;
        }
        assert(topic.sent[4].event == events::kDone);
        assert(!topic.sent[4].payload.contains("error"));
        assert(reassembled == data);
        assert(topic.unread() == 1);

        assert(summary.bytes == data.size());
        assert(summary.chunks == 3);
        assert(summary.completed);
        const auto view = std::as_bytes(std::span(data.data(), data.size()));
        assert(summary.digest == crypto::hash_bytes(view));
        assert(producer_respects_pulls(topic.trace));
    }

    void test_producer_ignores_unrelated_events()
    {
        ScriptedTopic topic({custom("presence_diff"), custom(events::kNoMoreData), custom(events::kBytesRequested),
                             custom(events::kBytesRequested)});
        std::istringstream input("abc");
        Producer producer(topic, input, Logger{}, 16);
        const auto summary = producer.run();

        assert(summary.completed);
        assert(topic.sent.size() == 3);
        assert(topic.sent[1].event == events::kBytes);
        assert(decoded_data(topic.sent[1].payload) == "abc");
        assert(topic.sent[2].event == events::kDone);
        assert(producer_respects_pulls(topic.trace));
    }

    void test_producer_read_failure()
    {
        FailingBuffer buffer("abcdefgh");
        std::istream input(&buffer);
        std::vector<protocol::ChannelEvent> script(4, custom(events::kBytesRequested));
        ScriptedTopic topic(script);
        Producer producer(topic, input, Logger{}, 4);
        const auto summary = producer.run();

        assert(topic.sent.size() == 4);
        assert(decoded_data(topic.sent[1].payload) == "abcd");
        assert(decoded_data(topic.sent[2].payload) == "efgh");
        assert(topic.sent[3].event == events::kDone);
        assert(topic.sent[3].payload == nlohmann::json({{"error", true}}));
        assert(summary.read_failed);
        assert(summary.completed);
        assert(summary.bytes == 8);
        assert(topic.unread() == 1);
    }

    void test_producer_sends_partial_reads()
    {
        {
            PacedBuffer buffer({"abc"}, true);
            std::istream input(&buffer);
            ScriptedTopic topic(std::vector<protocol::ChannelEvent>(2, custom(events::kBytesRequested)));
            Producer producer(topic, input, Logger{});
            const auto summary = producer.run();

            assert(topic.sent.size() == 3);
            assert(topic.sent[1].event == events::kBytes);
            assert(decoded_data(topic.sent[1].payload) == "abc");
            assert(topic.sent[2].payload == nlohmann::json({{"error", true}}));
            assert(summary.bytes == 3);
            assert(summary.read_failed);
        }
        {
            PacedBuffer buffer({"abc", "defgh"}, false);
            std::istream input(&buffer);
            ScriptedTopic topic(std::vector<protocol::ChannelEvent>(4, custom(events::kBytesRequested)));
            Producer producer(topic, input, Logger{});
            const auto summary = producer.run();

            assert(topic.sent.size() == 4);
            assert(decoded_data(topic.sent[1].payload) == "abc");
            assert(buffer.underflows() == 2);
            assert(decoded_data(topic.sent[2].payload) == "defgh");
            assert(topic.sent[3].event == events::kDone);
            assert(topic.sent[3].payload == nlohmann::json::object());
            assert(summary.chunks == 2);
            assert(!summary.read_failed);
            assert(topic.unread() == 1);
        }
    }

    void test_producer_sequence_ends_early()
    {
        ScriptedTopic topic({custom(events::kBytesRequested)});
        std::istringstream input("more than one chunk");
        Producer producer(topic, input, Logger{}, 4);
        const auto summary = producer.run();

        assert(producer.state() == ProducerState::ReadyToProduce);
        assert(!summary.completed);
        assert(summary.chunks == 1);
        assert(topic.sent.back().event == events::kBytes);
    }

    void test_consumer_writes_until_no_more_data()
    {
        ScriptedTopic topic({bytes_event("hello "), bytes_event("world"), custom(events::kNoMoreData),
                             bytes_event("ignored")});
        std::ostringstream output;
        Consumer consumer(topic, output, Logger{});
        const auto summary = consumer.run();

        assert(output.str() == "hello world");
        assert(consumer.state() == ConsumerState::Done);
        assert(summary.completed);
        assert(summary.bytes == 11);
        assert(summary.chunks == 2);
        assert(topic.unread() == 1);

        const std::vector<std::string> expected = {">consumer_join", ">request_bytes", "<bytes", ">request_bytes",
                                                   "<bytes", ">request_bytes", "<no_more_data"};
        assert(topic.trace == expected);
    }

    void test_consumer_rejects_malformed_chunks()
    {
        const std::vector<nlohmann::json> payloads = {
            nlohmann::json::array({1, 2}),
            nlohmann::json::object(),
            nlohmann::json({{"data", 42}}),
            nlohmann::json({{"data", "not base64!"}}),
        };
        for (const auto &payload : payloads)
        {
            ScriptedTopic topic({bytes_event("ok"), custom(events::kBytes, payload)});
            std::ostringstream output;
            Consumer consumer(topic, output, Logger{});
            bool rejected = false;
            try
            {
                (void)consumer.run();
            }
            catch (const PastaError &error)
            {
                rejected = error.kind() == ErrorKind::FatalProtocolError;
            }
            assert(rejected);
            assert(output.str() == "ok");
        }
    }

    void test_consumer_sequence_ends_early()
    {
        ScriptedTopic topic({bytes_event("partial")});
        std::ostringstream output;
        Consumer consumer(topic, output, Logger{});
        const auto summary = consumer.run();

        assert(!summary.completed);
        assert(consumer.state() == ConsumerState::Consuming);
        assert(output.str() == "partial");
    }

    // In-memory stand-in for the server's relay: each consumer pull becomes a
    // "bytes_requested" for the producer, each producer chunk is forwarded to
    // the consumer, and "done" turns into "no_more_data".
    class LoopbackBroker
    {
    public:
        class Endpoint : public ChannelTopic
        {
        public:
            Endpoint(LoopbackBroker &broker, bool producer_side)
                : broker_(broker),
                  producer_side_(producer_side) {}

            const std::string &name() const override { return broker_.topic_; }

            void send(std::string_view event, const nlohmann::json &payload) override
            {
                broker_.relay(producer_side_, event, payload);
            }

            std::optional<protocol::ChannelEvent> next_event() override { return inbox.pop(); }

            BlockingQueue<protocol::ChannelEvent> inbox{64};

        private:
            LoopbackBroker &broker_;
            bool producer_side_;
        };

        Endpoint producer{*this, true};
        Endpoint consumer{*this, false};

        bool flow_violated() const
        {
            std::lock_guard lock(mutex_);
            return violated_;
        }

    private:
        void relay(bool from_producer, std::string_view event, const nlohmann::json &payload)
        {
            std::lock_guard lock(mutex_);
            if (from_producer)
            {
                if (event == events::kBytes)
                {
                    if (outstanding_ == 0)
                    {
                        violated_ = true;
                    }
                    else
                    {
                        --outstanding_;
                    }
                    consumer.inbox.push(custom(events::kBytes, payload));
                }
                else if (event == events::kDone)
                {
                    consumer.inbox.push(custom(events::kNoMoreData));
                    consumer.inbox.close();
                    producer.inbox.close();
                }
                return;
            }
            if (event == events::kRequestBytes)
            {
                if (outstanding_ != 0)
                {
                    violated_ = true;
                }
                ++outstanding_;
                producer.inbox.push(custom(events::kBytesRequested));
            }
        }

        std::string topic_{"streams:loopback"};
        mutable std::mutex mutex_;
        int outstanding_{0};
        bool violated_{false};
    };

    void test_loopback_round_trip()
    {
        std::string data(2'345'678, '\0');
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            data[i] = static_cast<char>((i * 7 + i / 1000) % 256);
        }

        LoopbackBroker broker;
        std::istringstream input(data);
        std::ostringstream output;

        TransferSummary produced;
        std::exception_ptr producer_failure;
        std::thread producer_thread([&]
                                    {
                                        try
                                        {
                                            Producer producer(broker.producer, input, Logger{});
                                            produced = producer.run();
                                        }
                                        catch (const std::exception &)
                                        {
                                            producer_failure = std::current_exception();
                                        } });

        Consumer consumer(broker.consumer, output, Logger{});
        const auto consumed = consumer.run();
        producer_thread.join();

        assert(!producer_failure);
        assert(!broker.flow_violated());
        assert(output.str() == data);
        assert(produced.completed);
        assert(consumed.completed);
        assert(produced.chunks == 3);
        assert(consumed.chunks == 3);
        assert(produced.bytes == data.size());
        assert(consumed.bytes == data.size());
        assert(produced.digest == consumed.digest);
    }

    void test_state_labels()
    {
        assert(to_string(ProducerState::ReadyToProduce) == "ready_to_produce");
        assert(to_string(ConsumerState::Done) == "done");
    }

} // namespace

void run_transfer_tests()
{
    test_producer_empty_input();
    test_producer_chunks_large_input();
    test_producer_ignores_unrelated_events();
    test_producer_read_failure();
    test_producer_sends_partial_reads();
    test_producer_sequence_ends_early();
    test_consumer_writes_until_no_more_data();
    test_consumer_rejects_malformed_chunks();
    test_consumer_sequence_ends_early();
    test_loopback_round_trip();
    test_state_labels();
}
