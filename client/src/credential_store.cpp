#include "copypasta/client/credential_store.hpp"

#include <fstream>
#include <stdexcept>

#include "copypasta/errors.hpp"

namespace copypasta::client
{

    void to_json(nlohmann::json &json, const Credentials &credentials)
    {
        json = {
            {"token", credentials.token},
            {"host", credentials.host},
        };
    }

    void from_json(const nlohmann::json &json, Credentials &credentials)
    {
        credentials.token = json.at("token").get<std::string>();
        credentials.host = json.value("host", std::string{});
    }

    CredentialStore::CredentialStore(std::filesystem::path path)
        : path_(std::move(path)) {}

    Credentials CredentialStore::load() const
    {
        if (!std::filesystem::is_regular_file(path_))
        {
            throw PastaError::no_config_found(path_.string());
        }
        std::ifstream in(path_);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open credential file " + path_.string());
        }
        try
        {
            nlohmann::json json;
            in >> json;
            return json.get<Credentials>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Malformed credential file " + path_.string() + ": " + ex.what());
        }
    }

    std::optional<Credentials> CredentialStore::try_load() const
    {
        try
        {
            return load();
        }
        catch (const PastaError &error)
        {
            if (error.kind() != ErrorKind::NoConfigFound)
            {
                throw;
            }
            return std::nullopt;
        }
    }

    void CredentialStore::save(const Credentials &credentials) const
    {
        const auto dir = path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        std::ofstream out(path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Could not write credential file " + path_.string());
        }
        out << nlohmann::json(credentials).dump(2);
        if (!out)
        {
            throw std::runtime_error("Failed writing credential file " + path_.string());
        }
        out.close();
        std::error_code ec;
        std::filesystem::permissions(path_, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
    }

} // namespace copypasta::client
