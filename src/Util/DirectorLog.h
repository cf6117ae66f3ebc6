#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

struct LogSettings
{
    // spdlog level name: trace, debug, info, warn, error, critical, off.
    std::string level = "info";
    // Optional log file; empty keeps console output only.
    std::string filePath;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%l][%n] %v";
};

// Configure level, pattern and sinks for every director category logger.
// Safe to call again after a config reload.
void InitDirectorLogging(LogSettings const& settings);

// Logger for a dotted category such as "director.pacing". Created on first use.
std::shared_ptr<spdlog::logger> GetDirectorLogger(std::string const& category);

#define DIRECTOR_LOG_TRACE(category, ...) GetDirectorLogger(category)->trace(__VA_ARGS__)
#define DIRECTOR_LOG_DEBUG(category, ...) GetDirectorLogger(category)->debug(__VA_ARGS__)
#define DIRECTOR_LOG_INFO(category, ...) GetDirectorLogger(category)->info(__VA_ARGS__)
#define DIRECTOR_LOG_WARN(category, ...) GetDirectorLogger(category)->warn(__VA_ARGS__)
#define DIRECTOR_LOG_ERROR(category, ...) GetDirectorLogger(category)->error(__VA_ARGS__)
