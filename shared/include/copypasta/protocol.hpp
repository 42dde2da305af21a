/**
 * Copypasta - REST API schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace copypasta::protocol
{

    struct UserInfo
    {
        std::string username;
    };

    void to_json(nlohmann::json &json, const UserInfo &info);
    void from_json(const nlohmann::json &json, UserInfo &info);

    // Body of a 403 from any authenticated endpoint.
    struct LoginResponse
    {
        std::string login_url;
    };

    void to_json(nlohmann::json &json, const LoginResponse &response);
    void from_json(const nlohmann::json &json, LoginResponse &response);

    struct CreateStreamResponse
    {
        std::string name;
    };

    void to_json(nlohmann::json &json, const CreateStreamResponse &response);
    void from_json(const nlohmann::json &json, CreateStreamResponse &response);

    struct Pasta
    {
        std::int64_t id{};
        std::string content;
        std::int32_t copied_count{};
        std::string perma_id;
        std::string inserted_at;
    };

    void to_json(nlohmann::json &json, const Pasta &pasta);
    void from_json(const nlohmann::json &json, Pasta &pasta);

    struct CreatePasta
    {
        std::string content;
    };

    void to_json(nlohmann::json &json, const CreatePasta &request);
    void from_json(const nlohmann::json &json, CreatePasta &request);

} // namespace copypasta::protocol
