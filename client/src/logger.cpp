#include "copypasta/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace copypasta::client
{

    Logger::Logger()
        : Logger(std::nullopt, false) {}

    Logger::Logger(const std::optional<std::filesystem::path> &path, bool verbose)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true));
            }
            if (verbose)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
            if (sinks.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("copypasta", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            logger_->set_level(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &)
        {
            logger_.reset();
        }
    }

} // namespace copypasta::client
