#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace copypasta::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Standard alphabet with padding. Whitespace is skipped; any other
    // character outside the alphabet, data after padding, or a truncated
    // final quantum yields std::nullopt.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace copypasta::encoding
