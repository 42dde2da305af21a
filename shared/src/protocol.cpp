#include "copypasta/protocol.hpp"

namespace copypasta::protocol
{

    void to_json(nlohmann::json &json, const UserInfo &info)
    {
        json = {{"username", info.username}};
    }

    void from_json(const nlohmann::json &json, UserInfo &info)
    {
        info.username = json.at("username").get<std::string>();
    }

    void to_json(nlohmann::json &json, const LoginResponse &response)
    {
        json = {{"login_url", response.login_url}};
    }

    void from_json(const nlohmann::json &json, LoginResponse &response)
    {
        response.login_url = json.at("login_url").get<std::string>();
    }

    void to_json(nlohmann::json &json, const CreateStreamResponse &response)
    {
        json = {{"name", response.name}};
    }

    void from_json(const nlohmann::json &json, CreateStreamResponse &response)
    {
        response.name = json.at("name").get<std::string>();
    }

    void to_json(nlohmann::json &json, const Pasta &pasta)
    {
        json = {
            {"id", pasta.id},
            {"content", pasta.content},
            {"copied_count", pasta.copied_count},
            {"perma_id", pasta.perma_id},
            {"inserted_at", pasta.inserted_at},
        };
    }

    void from_json(const nlohmann::json &json, Pasta &pasta)
    {
        pasta.id = json.at("id").get<std::int64_t>();
        pasta.content = json.at("content").get<std::string>();
        pasta.copied_count = json.value("copied_count", 0);
        pasta.perma_id = json.value("perma_id", std::string{});
        pasta.inserted_at = json.value("inserted_at", std::string{});
    }

    void to_json(nlohmann::json &json, const CreatePasta &request)
    {
        json = {{"content", request.content}};
    }

    void from_json(const nlohmann::json &json, CreatePasta &request)
    {
        request.content = json.at("content").get<std::string>();
    }

} // namespace copypasta::protocol
