#include "Ai/LlmPrompts.h"
#include "Config/DirectorConfig.h"
#include "Util/DirectorErrors.h"

#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <string>

namespace
{
std::string WriteTempConfig(std::string const& name, std::string const& contents)
{
    std::string path = std::string(P_tmpdir) + "/" + name;
    std::ofstream out(path, std::ios::trunc);
    out << contents;
    return path;
}
}

TEST_CASE("DirectorConfig defaults")
{
    DirectorConfig config = ParseDirectorConfig(nlohmann::json::object());

    REQUIRE(config.randomSeed == 0x5eed);
    REQUIRE(config.decision.skillBaseChance == Approx(0.7));
    REQUIRE(config.decision.skillDifficulty == 12);
    REQUIRE(config.pacing.lullMinutes == 10);
    REQUIRE(config.pacing.stagnantMinutes == 15);
    REQUIRE(config.pacing.ambientCooldownMinutes == 5);
    REQUIRE(config.pacing.sessionStaleMinutes == 30);
    REQUIRE(config.idleNpc.minIdleSeconds == 180);
    REQUIRE(config.idleNpc.maxIdleSeconds == 480);
    REQUIRE(config.idleNpc.npcCooldownSeconds == 300);
    REQUIRE(config.idleNpc.maxInitiativesPerSession == 5);
    REQUIRE(config.summary.cooldownMinutes == 120);
    REQUIRE(config.summary.minEvents == 10);
    REQUIRE(config.summary.minTokens == 2000);
    REQUIRE(config.summary.prompt == GetDefaultSummaryPrompt());
    REQUIRE_FALSE(config.ollama.enable);
    REQUIRE(config.log.level == "info");
}

TEST_CASE("DirectorConfig option forms")
{
    SECTION("nested objects")
    {
        nlohmann::json document = {{"Director", {{"Pacing", {{"LullMinutes", 7}}}, {"IdleNpc", {{"MaxPerSession", 2}}}}}};
        DirectorConfig config = ParseDirectorConfig(document);
        REQUIRE(config.pacing.lullMinutes == 7);
        REQUIRE(config.idleNpc.maxInitiativesPerSession == 2);
        REQUIRE(config.pacing.stagnantMinutes == 15);
    }

    SECTION("flat dotted keys")
    {
        nlohmann::json document = {{"Director.Summary.TimeoutMs", 250}, {"Director.Ollama.Model", "qwen3:4b"}};
        DirectorConfig config = ParseDirectorConfig(document);
        REQUIRE(config.summary.timeoutMs == 250);
        REQUIRE(config.ollama.model == "qwen3:4b");
    }

    SECTION("flat key wins over the nested form")
    {
        nlohmann::json document = {
            {"Director.Pacing.LullMinutes", 3},
            {"Director", {{"Pacing", {{"LullMinutes", 9}}}}}};
        REQUIRE(ParseDirectorConfig(document).pacing.lullMinutes == 3);
    }

    SECTION("prompt escapes are expanded")
    {
        nlohmann::json document = {{"Director.Summary.Prompt", "Events:\\n{event_log}\\nBefore: {previous_summary}"}};
        REQUIRE(ParseDirectorConfig(document).summary.prompt == "Events:\n{event_log}\nBefore: {previous_summary}");
    }
}

TEST_CASE("DirectorConfig rejects unusable values")
{
    SECTION("negative duration")
    {
        nlohmann::json document = {{"Director.Pacing.LullMinutes", -5}};
        REQUIRE_THROWS_AS(ParseDirectorConfig(document), ConfigError);
    }

    SECTION("wrong type")
    {
        nlohmann::json document = {{"Director.IdleNpc.MinIdleSeconds", "three minutes"}};
        REQUIRE_THROWS_AS(ParseDirectorConfig(document), ConfigError);
    }

    SECTION("forced idle window below the minimum")
    {
        nlohmann::json document = {{"Director.IdleNpc.MinIdleSeconds", 300}, {"Director.IdleNpc.MaxIdleSeconds", 240}};
        REQUIRE_THROWS_AS(ParseDirectorConfig(document), ConfigError);
    }

    SECTION("zero summary timeout")
    {
        nlohmann::json document = {{"Director.Summary.TimeoutMs", 0}};
        REQUIRE_THROWS_AS(ParseDirectorConfig(document), ConfigError);
    }

    SECTION("chance out of range")
    {
        nlohmann::json document = {{"Director.Decision.SkillBaseChance", 1.5}};
        REQUIRE_THROWS_AS(ParseDirectorConfig(document), ConfigError);
    }

    SECTION("Ollama without a model")
    {
        nlohmann::json document = {{"Director.Ollama.Enable", true}, {"Director.Ollama.Model", " "}};
        REQUIRE_THROWS_AS(ParseDirectorConfig(document), ConfigError);
    }

    SECTION("unknown log level")
    {
        nlohmann::json document = {{"Director.Log.Level", "chatty"}};
        REQUIRE_THROWS_AS(ParseDirectorConfig(document), ConfigError);
    }

    SECTION("root is not an object")
    {
        REQUIRE_THROWS_AS(ParseDirectorConfig(nlohmann::json::array()), ConfigError);
    }
}

TEST_CASE("DirectorConfig files")
{
    SECTION("shipped sample loads")
    {
        DirectorConfig config = LoadDirectorConfig(std::string(DIRECTOR_TEST_DATA_DIR) + "/ollama-gm-director.json.dist");
        REQUIRE(config.randomSeed == 24301);
        REQUIRE(config.pacing.locationOverrideMinutes == 20);
        REQUIRE(config.summary.recentEventCount == 5);
        REQUIRE(config.summary.prompt == GetDefaultSummaryPrompt());
        REQUIRE(config.ollama.url == "http://localhost:11434/api/generate");
    }

    SECTION("missing file")
    {
        REQUIRE_THROWS_AS(LoadDirectorConfig("/nonexistent/ollama-gm-director.json"), ConfigError);
    }

    SECTION("broken JSON")
    {
        std::string path = WriteTempConfig("director-broken.json", "{ \"Director\": { \"Pacing\": ");
        REQUIRE_THROWS_AS(LoadDirectorConfig(path), ConfigError);
        std::remove(path.c_str());
    }

    SECTION("comments are allowed")
    {
        std::string path = WriteTempConfig("director-comments.json",
                                           "{\n  // quieter sessions\n  \"Director.Pacing.LullMinutes\": 20\n}\n");
        REQUIRE(LoadDirectorConfig(path).pacing.lullMinutes == 20);
        std::remove(path.c_str());
    }
}
