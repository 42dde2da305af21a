#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace copypasta::client
{

    struct Credentials
    {
        std::string token;
        std::string host;
    };

    void to_json(nlohmann::json &json, const Credentials &credentials);
    void from_json(const nlohmann::json &json, Credentials &credentials);

    // The credential file: {"token": ..., "host": ...}, rewritten whole on save.
    class CredentialStore
    {
    public:
        explicit CredentialStore(std::filesystem::path path);

        // Throws PastaError(NoConfigFound) when the file does not exist.
        Credentials load() const;

        std::optional<Credentials> try_load() const;

        void save(const Credentials &credentials) const;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

} // namespace copypasta::client
