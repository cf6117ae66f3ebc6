#include "Util/DirectorLog.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace
{
    std::mutex s_LogMutex;
    LogSettings s_LogSettings;
    std::vector<spdlog::sink_ptr> s_Sinks;

    std::vector<spdlog::sink_ptr>& SharedSinks()
    {
        // Console sink is always present; the file sink is added by InitDirectorLogging.
        if (s_Sinks.empty())
        {
            s_Sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
        return s_Sinks;
    }

    std::shared_ptr<spdlog::logger> CreateLogger(std::string const& category)
    {
        auto& sinks = SharedSinks();
        auto logger = std::make_shared<spdlog::logger>(category, sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(s_LogSettings.level));
        logger->set_pattern(s_LogSettings.pattern);
        spdlog::register_logger(logger);
        return logger;
    }
}

void InitDirectorLogging(LogSettings const& settings)
{
    std::lock_guard<std::mutex> lock(s_LogMutex);
    s_LogSettings = settings;

    s_Sinks.clear();
    SharedSinks();
    if (!settings.filePath.empty())
    {
        try
        {
            s_Sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.filePath));
        }
        catch (spdlog::spdlog_ex const& ex)
        {
            // Keep console logging; a bad log path must not take the host down.
            spdlog::error("[Director] Failed to open log file {}: {}", settings.filePath, ex.what());
        }
    }

    // Rebuild existing category loggers so they pick up the new sinks.
    std::vector<std::string> names;
    spdlog::apply_all([&names](std::shared_ptr<spdlog::logger> logger)
    {
        if (logger->name().rfind("director.", 0) == 0)
        {
            names.push_back(logger->name());
        }
    });
    for (auto const& name : names)
    {
        spdlog::drop(name);
        CreateLogger(name);
    }
}

std::shared_ptr<spdlog::logger> GetDirectorLogger(std::string const& category)
{
    std::lock_guard<std::mutex> lock(s_LogMutex);
    if (auto existing = spdlog::get(category))
    {
        return existing;
    }
    return CreateLogger(category);
}
