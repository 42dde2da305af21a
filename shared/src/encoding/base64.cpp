#include "copypasta/encoding/base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace copypasta::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        constexpr std::int8_t kInvalid = -1;
        constexpr std::int8_t kPadding = -2;

        consteval auto make_decode_table()
        {
            std::array<std::int8_t, 256> table{};
            table.fill(kInvalid);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::int8_t>(i);
            }
            table[static_cast<unsigned char>('=')] = kPadding;
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::uint32_t buffer = 0;
        int bits_collected = 0;

        for (const auto byte : data)
        {
            buffer = (buffer << 8u) | static_cast<std::uint32_t>(byte);
            bits_collected += 8;
            while (bits_collected >= 6)
            {
                bits_collected -= 6;
                const auto index = static_cast<std::size_t>((buffer >> bits_collected) & 0x3Fu);
                output.push_back(kAlphabet[index]);
            }
        }

        if (bits_collected > 0)
        {
            buffer <<= (6 - bits_collected);
            const auto index = static_cast<std::size_t>(buffer & 0x3F);
            output.push_back(kAlphabet[index]);
        }

        while (output.size() % 4 != 0)
        {
            output.push_back('=');
        }

        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        std::vector<std::byte> output;
        output.reserve((input.size() * 3) / 4);

        std::uint32_t accumulator = 0;
        int bits_collected = 0;
        std::size_t symbols = 0;
        std::size_t padding = 0;
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            const int value = kDecodeTable[c];
            if (value == kInvalid)
            {
                if (!std::isspace(c))
                {
                    return std::nullopt;
                }
                continue;
            }
            if (value == kPadding)
            {
                ++padding;
                continue;
            }
            if (padding > 0)
            {
                return std::nullopt;
            }
            ++symbols;
            accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
            bits_collected += 6;
            if (bits_collected >= 8)
            {
                bits_collected -= 8;
                const auto byte_value = static_cast<std::uint8_t>((accumulator >> bits_collected) & 0xFFu);
                output.push_back(static_cast<std::byte>(byte_value));
            }
        }

        if (symbols % 4 == 1 || padding > 2)
        {
            return std::nullopt;
        }
        if (padding > 0 && (symbols + padding) % 4 != 0)
        {
            return std::nullopt;
        }

        return output;
    }

} // namespace copypasta::encoding
