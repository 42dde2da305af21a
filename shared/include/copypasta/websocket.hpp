/**
 * Copypasta - RFC 6455 client framing and upgrade handshake helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "copypasta/http.hpp"

namespace copypasta::websocket
{

    enum class Opcode : std::uint8_t
    {
        Continuation = 0x0,
        Text = 0x1,
        Binary = 0x2,
        Close = 0x8,
        Ping = 0x9,
        Pong = 0xA
    };

    using MaskKey = std::array<std::uint8_t, 4>;

    struct Frame
    {
        bool fin{true};
        Opcode opcode{Opcode::Text};
        std::vector<std::uint8_t> payload{};
    };

    struct DecodedFrame
    {
        Frame frame;
        std::size_t bytes_consumed{};
    };

    constexpr std::size_t kDefaultMaxPayload = 16 * 1024 * 1024;

    bool is_control(Opcode opcode) noexcept;

    // Client-to-server frames are always masked.
    std::vector<std::uint8_t> encode_frame(Opcode opcode, std::span<const std::uint8_t> payload, const MaskKey &mask,
                                           bool fin = true);

    // Same as encode_frame with a fresh random mask.
    std::vector<std::uint8_t> encode_client_frame(Opcode opcode, std::span<const std::uint8_t> payload);

    // Returns std::nullopt until a whole frame is buffered. Throws
    // PastaError(FatalProtocolError) on reserved bits, unknown opcodes or
    // payloads above max_payload.
    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer,
                                                 std::size_t max_payload = kDefaultMaxPayload);

    // Joins fragmented data frames into whole messages.
    class MessageAssembler
    {
    public:
        explicit MessageAssembler(std::size_t max_message = kDefaultMaxPayload);

        std::optional<std::string> push(const Frame &frame);

    private:
        std::size_t max_message_;
        bool in_progress_{false};
        std::string pending_;
    };

    std::string make_handshake_key();

    http::Request make_handshake_request(const http::Url &url, const std::string &key);

    // base64(SHA-1(key + RFC 6455 GUID)), the value a server must echo in
    // Sec-WebSocket-Accept.
    std::string handshake_accept(const std::string &key);

    // Throws PastaError(RequestError) unless the server switched protocols
    // and answered this key.
    void verify_handshake_response(const http::Response &response, const std::string &key);

} // namespace copypasta::websocket
