#include "Config/DirectorConfig.h"
#include "Ai/LlmPrompts.h"
#include "Util/DirectorErrors.h"
#include "Util/TextUtil.h"

#include <fmt/format.h>

#include <fstream>
#include <limits>

namespace
{
constexpr char const* kConfigCategory = "director.config";

class OptionReader
{
public:
    explicit OptionReader(nlohmann::json const& document) : document_(document) {}

    template <typename T>
    T GetOption(std::string const& key, T const& defaultValue) const
    {
        nlohmann::json const* node = Find(key);
        if (!node || node->is_null())
        {
            return defaultValue;
        }
        try
        {
            return node->get<T>();
        }
        catch (nlohmann::json::exception const& ex)
        {
            throw ConfigError(fmt::format("Option {} has the wrong type: {}", key, ex.what()));
        }
    }

    // Durations and counts. Rejects negatives before they wrap around.
    uint32_t GetCount(std::string const& key, uint32_t defaultValue, uint32_t minimum = 0) const
    {
        int64_t value = GetOption<int64_t>(key, static_cast<int64_t>(defaultValue));
        if (value < static_cast<int64_t>(minimum))
        {
            throw ConfigError(fmt::format("Option {} must be at least {} (got {})", key, minimum, value));
        }
        if (value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))
        {
            throw ConfigError(fmt::format("Option {} is out of range (got {})", key, value));
        }
        return static_cast<uint32_t>(value);
    }

private:
    // Flat "A.B.C" key first, then the nested {"A":{"B":{"C":...}}} form.
    nlohmann::json const* Find(std::string const& key) const
    {
        if (!document_.is_object())
        {
            return nullptr;
        }
        auto flat = document_.find(key);
        if (flat != document_.end())
        {
            return &*flat;
        }

        nlohmann::json const* node = &document_;
        size_t start = 0;
        while (true)
        {
            size_t dot = key.find('.', start);
            std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
            if (!node->is_object())
            {
                return nullptr;
            }
            auto it = node->find(part);
            if (it == node->end())
            {
                return nullptr;
            }
            node = &*it;
            if (dot == std::string::npos)
            {
                break;
            }
            start = dot + 1;
        }
        return node;
    }

    nlohmann::json const& document_;
};
}

DirectorConfig ParseDirectorConfig(nlohmann::json const& document)
{
    if (!document.is_object())
    {
        throw ConfigError("Config root must be a JSON object");
    }

    OptionReader reader(document);
    DirectorConfig config;

    config.randomSeed = reader.GetOption<uint64_t>("Director.RandomSeed", config.randomSeed);

    config.decision.skillBaseChance = reader.GetOption<double>("Director.Decision.SkillBaseChance", config.decision.skillBaseChance);
    config.decision.unrestPenalty = reader.GetOption<double>("Director.Decision.UnrestPenalty", config.decision.unrestPenalty);
    config.decision.skillDifficulty = reader.GetOption<int32_t>("Director.Decision.SkillDifficulty", config.decision.skillDifficulty);

    config.pacing.lullMinutes = reader.GetCount("Director.Pacing.LullMinutes", config.pacing.lullMinutes);
    config.pacing.stagnantMinutes = reader.GetCount("Director.Pacing.StagnantMinutes", config.pacing.stagnantMinutes);
    config.pacing.ambientCooldownMinutes = reader.GetCount("Director.Pacing.AmbientCooldownMinutes", config.pacing.ambientCooldownMinutes);
    config.pacing.activeInteractionsPerHour = reader.GetCount("Director.Pacing.ActiveInteractionsPerHour", config.pacing.activeInteractionsPerHour, 1);
    config.pacing.locationOverrideMinutes = reader.GetCount("Director.Pacing.LocationOverrideMinutes", config.pacing.locationOverrideMinutes);
    config.pacing.sessionStaleMinutes = reader.GetCount("Director.Pacing.SessionStaleMinutes", config.pacing.sessionStaleMinutes, 1);

    config.idleNpc.minIdleSeconds = reader.GetCount("Director.IdleNpc.MinIdleSeconds", config.idleNpc.minIdleSeconds);
    config.idleNpc.maxIdleSeconds = reader.GetCount("Director.IdleNpc.MaxIdleSeconds", config.idleNpc.maxIdleSeconds);
    config.idleNpc.npcCooldownSeconds = reader.GetCount("Director.IdleNpc.CooldownSeconds", config.idleNpc.npcCooldownSeconds);
    config.idleNpc.maxInitiativesPerSession = reader.GetCount("Director.IdleNpc.MaxPerSession", config.idleNpc.maxInitiativesPerSession);

    config.summary.cooldownMinutes = reader.GetCount("Director.Summary.CooldownMinutes", config.summary.cooldownMinutes);
    config.summary.minEvents = reader.GetCount("Director.Summary.MinEvents", config.summary.minEvents, 1);
    config.summary.minTokens = reader.GetCount("Director.Summary.MinTokens", config.summary.minTokens);
    config.summary.timeoutMs = reader.GetCount("Director.Summary.TimeoutMs", config.summary.timeoutMs, 1);
    config.summary.maxSentences = reader.GetCount("Director.Summary.MaxSentences", config.summary.maxSentences, 1);
    config.summary.maxChars = reader.GetCount("Director.Summary.MaxChars", config.summary.maxChars, 1);
    config.summary.recentEventCount = reader.GetCount("Director.Summary.RecentEventCount", config.summary.recentEventCount);
    config.summary.prompt = ExpandPromptEscapes(
        reader.GetOption<std::string>("Director.Summary.Prompt", GetDefaultSummaryPrompt()));
    if (TrimCopy(config.summary.prompt).empty())
    {
        config.summary.prompt = GetDefaultSummaryPrompt();
    }

    config.ollama.enable = reader.GetOption<bool>("Director.Ollama.Enable", config.ollama.enable);
    config.ollama.url = reader.GetOption<std::string>("Director.Ollama.Url", config.ollama.url);
    config.ollama.model = reader.GetOption<std::string>("Director.Ollama.Model", config.ollama.model);
    config.ollama.connectTimeoutMs = reader.GetCount("Director.Ollama.ConnectTimeoutMs", config.ollama.connectTimeoutMs, 1);
    config.ollama.requestTimeoutMs = reader.GetCount("Director.Ollama.RequestTimeoutMs", config.ollama.requestTimeoutMs, 1);

    config.log.level = reader.GetOption<std::string>("Director.Log.Level", config.log.level);
    config.log.filePath = reader.GetOption<std::string>("Director.Log.File", config.log.filePath);
    config.log.pattern = reader.GetOption<std::string>("Director.Log.Pattern", config.log.pattern);

    ValidateDirectorConfig(config);
    return config;
}

void ValidateDirectorConfig(DirectorConfig const& config)
{
    if (config.decision.skillBaseChance < 0.0 || config.decision.skillBaseChance > 1.0)
    {
        throw ConfigError(fmt::format("Director.Decision.SkillBaseChance must be within [0, 1] (got {})",
                                      config.decision.skillBaseChance));
    }
    if (config.decision.unrestPenalty < 0.0 || config.decision.unrestPenalty > 1.0)
    {
        throw ConfigError(fmt::format("Director.Decision.UnrestPenalty must be within [0, 1] (got {})",
                                      config.decision.unrestPenalty));
    }
    if (config.decision.skillDifficulty < 1 || config.decision.skillDifficulty > 20)
    {
        throw ConfigError(fmt::format("Director.Decision.SkillDifficulty must be within [1, 20] (got {})",
                                      config.decision.skillDifficulty));
    }
    if (config.pacing.activeInteractionsPerHour < 1)
    {
        throw ConfigError("Director.Pacing.ActiveInteractionsPerHour must be at least 1");
    }
    if (config.idleNpc.maxIdleSeconds < config.idleNpc.minIdleSeconds)
    {
        throw ConfigError(fmt::format("Director.IdleNpc.MaxIdleSeconds must not be below MinIdleSeconds ({} < {})",
                                      config.idleNpc.maxIdleSeconds, config.idleNpc.minIdleSeconds));
    }
    if (config.summary.minEvents < 1 || config.summary.timeoutMs < 1 || config.summary.maxSentences < 1)
    {
        throw ConfigError("Director.Summary thresholds must be at least 1");
    }
    if (config.ollama.enable && TrimCopy(config.ollama.url).empty())
    {
        throw ConfigError("Director.Ollama.Url is required when Director.Ollama.Enable is set");
    }
    if (config.ollama.enable && TrimCopy(config.ollama.model).empty())
    {
        throw ConfigError("Director.Ollama.Model is required when Director.Ollama.Enable is set");
    }
    if (spdlog::level::from_str(config.log.level) == spdlog::level::off && ToLowerCopy(config.log.level) != "off")
    {
        throw ConfigError(fmt::format("Director.Log.Level is not a log level (got {})", config.log.level));
    }
}

DirectorConfig LoadDirectorConfig(std::string const& path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        throw ConfigError(fmt::format("Cannot open config file {}", path));
    }

    nlohmann::json document;
    try
    {
        document = nlohmann::json::parse(in, nullptr, true, true);
    }
    catch (nlohmann::json::parse_error const& ex)
    {
        throw ConfigError(fmt::format("Config file {} is not valid JSON: {}", path, ex.what()));
    }

    DirectorConfig config = ParseDirectorConfig(document);
    DIRECTOR_LOG_INFO(kConfigCategory, "[Config] Loaded {} (lull={}m stagnant={}m summary timeout={}ms ollama={})",
                      path, config.pacing.lullMinutes, config.pacing.stagnantMinutes,
                      config.summary.timeoutMs, config.ollama.enable ? "on" : "off");
    return config;
}
