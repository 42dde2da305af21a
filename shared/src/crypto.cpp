#include "copypasta/crypto.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

namespace copypasta::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    void random_bytes(std::span<std::byte> output)
    {
        ensure_initialized_once();
        randombytes_buf(output.data(), output.size());
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    StreamDigest::StreamDigest()
    {
        ensure_initialized_once();
        if (crypto_generichash_init(&state_, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    void StreamDigest::update(std::span<const std::byte> data)
    {
        if (finalised_)
        {
            throw std::logic_error("StreamDigest updated after finalisation");
        }
        if (data.empty())
        {
            return;
        }
        if (crypto_generichash_update(&state_, reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string StreamDigest::final_hex()
    {
        if (finalised_)
        {
            return result_;
        }
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state_, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        finalised_ = true;
        result_ = to_hex(digest);
        return result_;
    }

} // namespace copypasta::crypto
