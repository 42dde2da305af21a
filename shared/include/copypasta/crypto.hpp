/**
 * Copypasta - Randomness and digest helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>

#include <sodium.h>

namespace copypasta::crypto
{

    void ensure_sodium_init();

    void random_bytes(std::span<std::byte> output);

    std::string hash_bytes(std::span<const std::byte> data);

    // Incremental BLAKE2b over a byte stream, finalised as lowercase hex.
    class StreamDigest
    {
    public:
        StreamDigest();

        void update(std::span<const std::byte> data);

        std::string final_hex();

    private:
        crypto_generichash_state state_;
        bool finalised_{false};
        std::string result_;
    };

} // namespace copypasta::crypto
