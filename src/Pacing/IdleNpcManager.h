#pragma once

#include "Ai/Collaborators.h"
#include "Config/DirectorConfig.h"
#include "Pacing/SceneContext.h"
#include "Util/Clock.h"
#include "Util/RandomSource.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class DialogueTheme : uint8_t
{
    WorldEventsConcern = 0,
    FriendlyCheckIn,
    LocalKnowledge,
    ProfessionalInquiry,
    CuriousObservation,
    ConcernForPlayer,
    WeatherComment
};

char const* DialogueThemeName(DialogueTheme theme);
// Topic list handed to the dialogue generator for a theme.
std::vector<std::string> const& ThemeTopics(DialogueTheme theme);

// World state first, then personality, then the player's reputation.
// Reserved NPCs with nothing else to go on remark on the weather.
DialogueTheme SelectDialogueTheme(NpcProfile const& npc, SceneContext const& scene);

// Chance in [0, 1] that an eligible NPC speaks up: its temperament adjusted
// for the player's reputation, world unrest and the location's aura. Past
// settings.maxIdleSeconds of idle time the chance is 1.
double InitiativeRate(NpcProfile const& npc, SceneContext const& scene, Duration idleDuration,
                      IdleNpcSettings const& settings);

struct NpcInitiativeState
{
    TimePoint lastInitiatedAt;
    uint32_t initiativeCount = 0;
};

struct InitiativeCheck
{
    bool initiate = false;
    std::optional<DialogueTheme> theme;
};

struct NpcInitiative
{
    std::string npcId;
    std::string npcName;
    DialogueTheme theme = DialogueTheme::FriendlyCheckIn;
    std::string dialogueText;
    // "<name> <dialogue>", ready for the renderer.
    std::string responseText;

    nlohmann::json ToJson() const;
};

// Decides when a present NPC speaks up unprompted. One instance per session.
class IdleNpcManager
{
public:
    IdleNpcManager(IdleNpcSettings settings,
                   std::shared_ptr<Clock> clock,
                   std::shared_ptr<DialogueGenerator> dialogueGenerator,
                   std::shared_ptr<EventSink> eventSink = nullptr);

    // Draws one roll from `rng` once the idle, cap and cooldown gates pass.
    InitiativeCheck ShouldInitiate(std::string const& npcId, SceneContext const& scene, Duration idleDuration,
                                   RandomSource& rng) const;

    // Generator failure or empty text returns nothing and leaves the cooldown alone.
    std::optional<NpcInitiative> GenerateInitiative(std::string const& npcId, DialogueTheme theme, SceneContext const& scene);

    // One check cycle: the first eligible NPC in scene order gets to speak.
    std::optional<NpcInitiative> CheckScene(SceneContext const& scene, Duration idleDuration, RandomSource& rng);

    uint32_t SessionInitiativeCount() const { return sessionInitiativeCount_; }
    std::optional<NpcInitiativeState> StateFor(std::string const& npcId) const;

    nlohmann::json GetStatistics() const;

private:
    IdleNpcSettings settings_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<DialogueGenerator> dialogueGenerator_;
    std::shared_ptr<EventSink> eventSink_;

    std::map<std::string, NpcInitiativeState> history_;
    uint32_t sessionInitiativeCount_ = 0;
    uint64_t generatorFailures_ = 0;
};
