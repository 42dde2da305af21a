#include "copypasta/client/transfer.hpp"

#include <algorithm>
#include <span>
#include <stdexcept>

#include "copypasta/encoding/base64.hpp"
#include "copypasta/errors.hpp"

namespace copypasta::client
{

    namespace events = protocol::events;

    std::string_view to_string(ProducerState state) noexcept
    {
        switch (state)
        {
        case ProducerState::ReadyToProduce:
            return "ready_to_produce";
        case ProducerState::Done:
            return "done";
        }
        return "unknown";
    }

    std::string_view to_string(ConsumerState state) noexcept
    {
        switch (state)
        {
        case ConsumerState::Consuming:
            return "consuming";
        case ConsumerState::Done:
            return "done";
        }
        return "unknown";
    }

    Producer::Producer(ChannelTopic &topic, std::istream &input, Logger logger, std::size_t chunk_size)
        : topic_(topic),
          input_(input),
          logger_(std::move(logger)),
          buffer_(chunk_size == 0 || chunk_size > kMaxChunkSize ? kMaxChunkSize : chunk_size) {}

    TransferSummary Producer::run()
    {
        topic_.send(events::kProducerJoin, nlohmann::json::object());
        logger_.log("produce", "announced producer on ", topic_.name());

        while (state_ != ProducerState::Done)
        {
            const auto event = topic_.next_event();
            if (!event)
            {
                logger_.log("produce", "event sequence ended in state ", to_string(state_));
                break;
            }
            handle(*event);
        }
        return summary();
    }

    ProducerState Producer::handle(const protocol::ChannelEvent &event)
    {
        if (state_ == ProducerState::ReadyToProduce && event.is(events::kBytesRequested))
        {
            produce_chunk();
        }
        return state_;
    }

    void Producer::produce_chunk()
    {
        // peek() blocks until at least one byte is buffered; the read below
        // then takes only what is already available so a slow pipe still
        // yields a chunk per request.
        const auto next = input_.peek();
        std::size_t read_count = 0;
        if (!input_.bad() && next != std::istream::traits_type::eof())
        {
            const auto available = input_.rdbuf()->in_avail();
            const auto wanted = available > 0
                                    ? std::min(static_cast<std::size_t>(available), buffer_.size())
                                    : std::size_t{1};
            input_.read(buffer_.data(), static_cast<std::streamsize>(wanted));
            read_count = static_cast<std::size_t>(input_.gcount());
        }

        if (input_.bad() || (read_count == 0 && !input_.eof()))
        {
            logger_.log("produce", "local read failed after ", bytes_, " bytes");
            topic_.send(events::kDone, nlohmann::json{{"error", true}});
            read_failed_ = true;
            state_ = ProducerState::Done;
            return;
        }
        if (read_count == 0)
        {
            logger_.log("produce", "end of input after ", bytes_, " bytes in ", chunks_, " chunks");
            topic_.send(events::kDone, nlohmann::json::object());
            state_ = ProducerState::Done;
            return;
        }

        const auto chunk = std::as_bytes(std::span(buffer_.data(), read_count));
        digest_.update(chunk);
        topic_.send(events::kBytes, nlohmann::json{{"data", encoding::encode_base64(chunk)}});
        bytes_ += read_count;
        ++chunks_;
        logger_.log("produce", "sent chunk ", chunks_, " (", read_count, " bytes)");
    }

    TransferSummary Producer::summary()
    {
        return TransferSummary{
            .bytes = bytes_,
            .chunks = chunks_,
            .digest = digest_.final_hex(),
            .completed = state_ == ProducerState::Done,
            .read_failed = read_failed_,
        };
    }

    Consumer::Consumer(ChannelTopic &topic, std::ostream &output, Logger logger)
        : topic_(topic),
          output_(output),
          logger_(std::move(logger)) {}

    TransferSummary Consumer::run()
    {
        topic_.send(events::kConsumerJoin, nlohmann::json::object());
        topic_.send(events::kRequestBytes, nlohmann::json::object());
        logger_.log("consume", "announced consumer on ", topic_.name());

        while (state_ != ConsumerState::Done)
        {
            const auto event = topic_.next_event();
            if (!event)
            {
                logger_.log("consume", "event sequence ended in state ", to_string(state_));
                break;
            }
            handle(*event);
        }
        output_.flush();
        return summary();
    }

    ConsumerState Consumer::handle(const protocol::ChannelEvent &event)
    {
        if (state_ != ConsumerState::Consuming)
        {
            return state_;
        }
        if (event.is(events::kBytes))
        {
            consume_chunk(event.payload);
            topic_.send(events::kRequestBytes, nlohmann::json::object());
        }
        else if (event.is(events::kNoMoreData))
        {
            logger_.log("consume", "no more data after ", bytes_, " bytes in ", chunks_, " chunks");
            state_ = ConsumerState::Done;
        }
        return state_;
    }

    void Consumer::consume_chunk(const nlohmann::json &payload)
    {
        if (!payload.is_object())
        {
            throw PastaError::protocol_error("bytes event payload is not an object");
        }
        const auto it = payload.find("data");
        if (it == payload.end() || !it->is_string())
        {
            throw PastaError::protocol_error("bytes event payload has no string \"data\" field");
        }
        const auto decoded = encoding::decode_base64(it->get_ref<const std::string &>());
        if (!decoded)
        {
            throw PastaError::protocol_error("bytes event payload is not valid base64");
        }

        output_.write(reinterpret_cast<const char *>(decoded->data()), static_cast<std::streamsize>(decoded->size()));
        if (!output_)
        {
            throw std::runtime_error("failed to write stream data to output");
        }
        digest_.update(*decoded);
        bytes_ += decoded->size();
        ++chunks_;
        logger_.log("consume", "wrote chunk ", chunks_, " (", decoded->size(), " bytes)");
    }

    TransferSummary Consumer::summary()
    {
        return TransferSummary{
            .bytes = bytes_,
            .chunks = chunks_,
            .digest = digest_.final_hex(),
            .completed = state_ == ConsumerState::Done,
            .read_failed = false,
        };
    }

} // namespace copypasta::client
