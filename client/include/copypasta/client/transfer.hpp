/**
 * Copypasta - Pull-based stream transfer over a joined channel topic.
 *
 * The producer only sends a chunk in answer to "bytes_requested" and the
 * consumer only asks for the next chunk after writing the previous one, so at
 * most one chunk is in flight per direction.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "copypasta/channel_protocol.hpp"
#include "copypasta/client/channel.hpp"
#include "copypasta/client/logger.hpp"
#include "copypasta/crypto.hpp"

namespace copypasta::client
{

    constexpr std::size_t kMaxChunkSize = 1'000'000;

    enum class ProducerState : std::uint8_t
    {
        ReadyToProduce,
        Done
    };

    enum class ConsumerState : std::uint8_t
    {
        Consuming,
        Done
    };

    std::string_view to_string(ProducerState state) noexcept;
    std::string_view to_string(ConsumerState state) noexcept;

    struct TransferSummary
    {
        std::uint64_t bytes{};
        std::uint64_t chunks{};
        std::string digest;
        // False when the event sequence ended before the terminal state.
        bool completed{};
        // Producer only: the final "done" carried the error flag.
        bool read_failed{};
    };

    class Producer
    {
    public:
        Producer(ChannelTopic &topic, std::istream &input, Logger logger, std::size_t chunk_size = kMaxChunkSize);

        // Announces the producer role, then serves pulls until Done or until
        // the event sequence ends.
        TransferSummary run();

        ProducerState handle(const protocol::ChannelEvent &event);

        ProducerState state() const noexcept { return state_; }

    private:
        void produce_chunk();
        TransferSummary summary();

        ChannelTopic &topic_;
        std::istream &input_;
        Logger logger_;
        std::vector<char> buffer_;
        ProducerState state_{ProducerState::ReadyToProduce};
        crypto::StreamDigest digest_;
        std::uint64_t bytes_{};
        std::uint64_t chunks_{};
        bool read_failed_{false};
    };

    class Consumer
    {
    public:
        Consumer(ChannelTopic &topic, std::ostream &output, Logger logger);

        // Announces the consumer role, primes the pull loop, then writes
        // chunks until "no_more_data" or until the event sequence ends.
        // Throws PastaError(FatalProtocolError) on a malformed chunk.
        TransferSummary run();

        ConsumerState handle(const protocol::ChannelEvent &event);

        ConsumerState state() const noexcept { return state_; }

    private:
        void consume_chunk(const nlohmann::json &payload);
        TransferSummary summary();

        ChannelTopic &topic_;
        std::ostream &output_;
        Logger logger_;
        ConsumerState state_{ConsumerState::Consuming};
        crypto::StreamDigest digest_;
        std::uint64_t bytes_{};
        std::uint64_t chunks_{};
    };

} // namespace copypasta::client
