#include "copypasta/websocket.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <span>
#include <string_view>

#include "copypasta/crypto.hpp"
#include "copypasta/encoding/base64.hpp"
#include "copypasta/errors.hpp"

namespace copypasta::websocket
{

    namespace
    {
        constexpr std::uint8_t kFinBit = 0x80;
        constexpr std::uint8_t kReservedBits = 0x70;
        constexpr std::uint8_t kOpcodeBits = 0x0F;
        constexpr std::uint8_t kMaskBit = 0x80;
        constexpr std::uint8_t kLengthBits = 0x7F;
        constexpr std::uint8_t kLength16 = 126;
        constexpr std::uint8_t kLength64 = 127;

        bool known_opcode(std::uint8_t value)
        {
            switch (static_cast<Opcode>(value))
            {
            case Opcode::Continuation:
            case Opcode::Text:
            case Opcode::Binary:
            case Opcode::Close:
            case Opcode::Ping:
            case Opcode::Pong:
                return true;
            }
            return false;
        }

        std::uint64_t read_be(std::span<const std::uint8_t> bytes)
        {
            std::uint64_t value = 0;
            for (const auto byte : bytes)
            {
                value = (value << 8) | byte;
            }
            return value;
        }
    } // namespace

    bool is_control(Opcode opcode) noexcept
    {
        return (static_cast<std::uint8_t>(opcode) & 0x08) != 0;
    }

    std::vector<std::uint8_t> encode_frame(Opcode opcode, std::span<const std::uint8_t> payload, const MaskKey &mask,
                                           bool fin)
    {
        std::vector<std::uint8_t> frame;
        frame.reserve(payload.size() + 14);
        frame.push_back(static_cast<std::uint8_t>((fin ? kFinBit : 0) | static_cast<std::uint8_t>(opcode)));

        const auto size = static_cast<std::uint64_t>(payload.size());
        if (size < kLength16)
        {
            frame.push_back(static_cast<std::uint8_t>(kMaskBit | size));
        }
        else if (size <= 0xFFFF)
        {
            frame.push_back(kMaskBit | kLength16);
            frame.push_back(static_cast<std::uint8_t>((size >> 8) & 0xFF));
            frame.push_back(static_cast<std::uint8_t>(size & 0xFF));
        }
        else
        {
            frame.push_back(kMaskBit | kLength64);
            for (int shift = 56; shift >= 0; shift -= 8)
            {
                frame.push_back(static_cast<std::uint8_t>((size >> shift) & 0xFF));
            }
        }

        frame.insert(frame.end(), mask.begin(), mask.end());
        for (std::size_t i = 0; i < payload.size(); ++i)
        {
            frame.push_back(static_cast<std::uint8_t>(payload[i] ^ mask[i % 4]));
        }
        return frame;
    }

    std::vector<std::uint8_t> encode_client_frame(Opcode opcode, std::span<const std::uint8_t> payload)
    {
        MaskKey mask{};
        crypto::random_bytes(std::as_writable_bytes(std::span(mask)));
        return encode_frame(opcode, payload, mask);
    }

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer, std::size_t max_payload)
    {
        if (buffer.size() < 2)
        {
            return std::nullopt;
        }
        const auto first = buffer[0];
        const auto second = buffer[1];
        if ((first & kReservedBits) != 0)
        {
            throw PastaError::protocol_error("websocket frame uses reserved bits");
        }
        const auto opcode_value = static_cast<std::uint8_t>(first & kOpcodeBits);
        if (!known_opcode(opcode_value))
        {
            throw PastaError::protocol_error("unknown websocket opcode " + std::to_string(opcode_value));
        }

        std::size_t offset = 2;
        std::uint64_t payload_size = second & kLengthBits;
        if (payload_size == kLength16)
        {
            if (buffer.size() < offset + 2)
            {
                return std::nullopt;
            }
            payload_size = read_be(buffer.subspan(offset, 2));
            offset += 2;
        }
        else if (payload_size == kLength64)
        {
            if (buffer.size() < offset + 8)
            {
                return std::nullopt;
            }
            payload_size = read_be(buffer.subspan(offset, 8));
            offset += 8;
        }
        if (payload_size > max_payload)
        {
            throw PastaError::protocol_error("websocket frame of " + std::to_string(payload_size) +
                                             " bytes exceeds limit");
        }

        const bool masked = (second & kMaskBit) != 0;
        MaskKey mask{};
        if (masked)
        {
            if (buffer.size() < offset + mask.size())
            {
                return std::nullopt;
            }
            std::copy_n(buffer.begin() + static_cast<std::ptrdiff_t>(offset), mask.size(), mask.begin());
            offset += mask.size();
        }

        if (buffer.size() < offset + payload_size)
        {
            return std::nullopt;
        }

        DecodedFrame result{
            .frame = Frame{
                .fin = (first & kFinBit) != 0,
                .opcode = static_cast<Opcode>(opcode_value),
                .payload = {},
            },
            .bytes_consumed = offset + static_cast<std::size_t>(payload_size),
        };
        const auto payload = buffer.subspan(offset, static_cast<std::size_t>(payload_size));
        result.frame.payload.assign(payload.begin(), payload.end());
        if (masked)
        {
            for (std::size_t i = 0; i < result.frame.payload.size(); ++i)
            {
                result.frame.payload[i] ^= mask[i % 4];
            }
        }
        if (is_control(result.frame.opcode) && (!result.frame.fin || payload_size > 125))
        {
            throw PastaError::protocol_error("fragmented or oversized websocket control frame");
        }
        return result;
    }

    MessageAssembler::MessageAssembler(std::size_t max_message)
        : max_message_(max_message) {}

    std::optional<std::string> MessageAssembler::push(const Frame &frame)
    {
        if (frame.opcode == Opcode::Continuation)
        {
            if (!in_progress_)
            {
                throw PastaError::protocol_error("websocket continuation without a started message");
            }
        }
        else
        {
            if (in_progress_)
            {
                throw PastaError::protocol_error("websocket message interleaved with a new data frame");
            }
            pending_.clear();
            in_progress_ = true;
        }

        if (pending_.size() + frame.payload.size() > max_message_)
        {
            throw PastaError::protocol_error("websocket message exceeds limit");
        }
        pending_.append(frame.payload.begin(), frame.payload.end());
        if (!frame.fin)
        {
            return std::nullopt;
        }
        in_progress_ = false;
        return std::move(pending_);
    }

    std::string make_handshake_key()
    {
        std::array<std::byte, 16> nonce{};
        crypto::random_bytes(nonce);
        return encoding::encode_base64(nonce);
    }

    http::Request make_handshake_request(const http::Url &url, const std::string &key)
    {
        http::Request request;
        request.method = "GET";
        request.target = url.target;
        request.headers = {
            {"Host", url.endpoint.authority()},
            {"Upgrade", "websocket"},
            {"Connection", "Upgrade"},
            {"Sec-WebSocket-Key", key},
            {"Sec-WebSocket-Version", "13"},
        };
        return request;
    }

    std::string handshake_accept(const std::string &key)
    {
        static constexpr std::string_view kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
        const auto input = key + std::string(kGuid);
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int digest_size = 0;
        if (EVP_Digest(input.data(), input.size(), digest.data(), &digest_size, EVP_sha1(), nullptr) != 1)
        {
            throw PastaError::protocol_error("SHA-1 digest of the websocket key failed");
        }
        return encoding::encode_base64(std::as_bytes(std::span(digest.data(), digest_size)));
    }

    void verify_handshake_response(const http::Response &response, const std::string &key)
    {
        if (response.status != 101)
        {
            throw PastaError::request_error("websocket upgrade refused with HTTP status " +
                                            std::to_string(response.status));
        }
        const auto upgrade = response.header("Upgrade");
        if (!upgrade || !http::iequals(*upgrade, "websocket"))
        {
            throw PastaError::request_error("websocket upgrade response lacks Upgrade: websocket");
        }
        const auto accept = response.header("Sec-WebSocket-Accept");
        if (!accept || accept->empty())
        {
            throw PastaError::request_error("websocket upgrade response lacks Sec-WebSocket-Accept");
        }
        if (*accept != handshake_accept(key))
        {
            throw PastaError::request_error("websocket upgrade response has a wrong Sec-WebSocket-Accept");
        }
    }

} // namespace copypasta::websocket
