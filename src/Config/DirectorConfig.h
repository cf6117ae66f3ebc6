#pragma once

#include "Util/DirectorLog.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

struct DecisionSettings
{
    // Branch-action skill check.
    double skillBaseChance = 0.7;
    double unrestPenalty = 0.1;
    int32_t skillDifficulty = 12;
};

struct PacingSettings
{
    uint32_t lullMinutes = 10;
    uint32_t stagnantMinutes = 15;
    uint32_t ambientCooldownMinutes = 5;
    // Interactions within the trailing hour needed to count as ACTIVE.
    uint32_t activeInteractionsPerHour = 3;
    // Staying longer than this in one location overrides the state gate.
    uint32_t locationOverrideMinutes = 20;
    uint32_t sessionStaleMinutes = 30;
};

struct IdleNpcSettings
{
    uint32_t minIdleSeconds = 180;
    // Past this much idle time every eligible NPC speaks up regardless of temperament.
    uint32_t maxIdleSeconds = 480;
    uint32_t npcCooldownSeconds = 300;
    uint32_t maxInitiativesPerSession = 5;
};

struct SummarySettings
{
    uint32_t cooldownMinutes = 120;
    uint32_t minEvents = 10;
    uint32_t minTokens = 2000;
    // Upper bound on the wait for the summarize collaborator.
    uint32_t timeoutMs = 10000;
    uint32_t maxSentences = 4;
    uint32_t maxChars = 800;
    uint32_t recentEventCount = 5;
    std::string prompt;
};

struct OllamaSettings
{
    bool enable = false;
    std::string url = "http://localhost:11434/api/generate";
    std::string model = "ministral-3:3b";
    uint32_t connectTimeoutMs = 3000;
    uint32_t requestTimeoutMs = 10000;
};

struct DirectorConfig
{
    // Base seed; every session derives its own stream from it.
    uint64_t randomSeed = 0x5eed;
    DecisionSettings decision;
    PacingSettings pacing;
    IdleNpcSettings idleNpc;
    SummarySettings summary;
    OllamaSettings ollama;
    LogSettings log;
};

// Read a JSON config file. Keys are dotted option names ("Director.Pacing.LullMinutes"),
// either flat at the top level or as nested objects. Missing keys keep their
// defaults. Throws ConfigError for unreadable files, wrong value types and
// values that fail validation.
DirectorConfig LoadDirectorConfig(std::string const& path);
DirectorConfig ParseDirectorConfig(nlohmann::json const& document);

// Throws ConfigError naming the first unusable option.
void ValidateDirectorConfig(DirectorConfig const& config);
