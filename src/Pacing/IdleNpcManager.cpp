#include "Pacing/IdleNpcManager.h"
#include "Util/DirectorErrors.h"
#include "Util/DirectorLog.h"
#include "Util/TextUtil.h"

#include <fmt/format.h>

#include <algorithm>
#include <initializer_list>
#include <utility>

namespace
{
constexpr char const* kNpcCategory = "director.npc";

bool PersonalityIs(std::string const& personality, std::initializer_list<char const*> names)
{
    for (char const* name : names)
    {
        if (personality == name)
            return true;
    }
    return false;
}

double TemperamentRate(std::string const& personality)
{
    static std::map<std::string, double> const rates = {
        {"curious", 0.9},
        {"friendly", 0.8},
        {"helpful", 0.7},
        {"wise", 0.6},
        {"professional", 0.5},
        {"suspicious", 0.4},
        {"shy", 0.3},
        {"gruff", 0.2},
    };
    auto it = rates.find(personality);
    return it == rates.end() ? 0.5 : it->second;
}
}

char const* DialogueThemeName(DialogueTheme theme)
{
    switch (theme)
    {
        case DialogueTheme::WorldEventsConcern:
            return "world_events_concern";
        case DialogueTheme::FriendlyCheckIn:
            return "friendly_check_in";
        case DialogueTheme::LocalKnowledge:
            return "local_knowledge";
        case DialogueTheme::ProfessionalInquiry:
            return "professional_inquiry";
        case DialogueTheme::CuriousObservation:
            return "curious_observation";
        case DialogueTheme::ConcernForPlayer:
            return "concern_for_player";
        case DialogueTheme::WeatherComment:
            return "weather_comment";
    }
    return "friendly_check_in";
}

std::vector<std::string> const& ThemeTopics(DialogueTheme theme)
{
    static std::vector<std::string> const worldEvents = {"worry", "information_sharing", "local_news"};
    static std::vector<std::string> const friendly = {"friendliness", "casual_conversation", "helpfulness"};
    static std::vector<std::string> const knowledge = {"wisdom", "local_lore", "helpful_advice"};
    static std::vector<std::string> const professional = {"business", "services", "transactions"};
    static std::vector<std::string> const curious = {"curiosity", "observation", "questions"};
    static std::vector<std::string> const concern = {"worry", "care", "friendliness"};
    static std::vector<std::string> const weather = {"casual_conversation", "observation"};

    switch (theme)
    {
        case DialogueTheme::WorldEventsConcern:
            return worldEvents;
        case DialogueTheme::LocalKnowledge:
            return knowledge;
        case DialogueTheme::ProfessionalInquiry:
            return professional;
        case DialogueTheme::CuriousObservation:
            return curious;
        case DialogueTheme::ConcernForPlayer:
            return concern;
        case DialogueTheme::WeatherComment:
            return weather;
        case DialogueTheme::FriendlyCheckIn:
            break;
    }
    return friendly;
}

DialogueTheme SelectDialogueTheme(NpcProfile const& npc, SceneContext const& scene)
{
    std::string political = ToLowerCopy(TrimCopy(scene.worldState.politicalStability));
    if (political == "unrest" || political == "rebellion" || political == "war")
        return DialogueTheme::WorldEventsConcern;

    std::string personality = ToLowerCopy(TrimCopy(npc.personality));
    if (PersonalityIs(personality, {"friendly", "helpful"}))
        return DialogueTheme::FriendlyCheckIn;
    if (PersonalityIs(personality, {"wise", "scholarly"}))
        return DialogueTheme::LocalKnowledge;
    if (PersonalityIs(personality, {"curious", "inquisitive"}))
        return DialogueTheme::CuriousObservation;
    if (PersonalityIs(personality, {"professional", "merchant"}))
        return DialogueTheme::ProfessionalInquiry;

    std::string const& reputation = scene.playerContext.reputationSummary;
    if (ContainsInsensitive(reputation, "disliked") || ContainsInsensitive(reputation, "concerned"))
        return DialogueTheme::ConcernForPlayer;

    if (PersonalityIs(personality, {"shy", "gruff", "suspicious"}))
        return DialogueTheme::WeatherComment;

    return DialogueTheme::FriendlyCheckIn;
}

double InitiativeRate(NpcProfile const& npc, SceneContext const& scene, Duration idleDuration,
                      IdleNpcSettings const& settings)
{
    if (idleDuration > std::chrono::seconds(settings.maxIdleSeconds))
        return 1.0;

    double rate = TemperamentRate(ToLowerCopy(TrimCopy(npc.personality)));

    // "disliked" contains "liked"; the negative words are checked first.
    std::string const& reputation = scene.playerContext.reputationSummary;
    if (ContainsInsensitive(reputation, "disliked") || ContainsInsensitive(reputation, "despised"))
        rate -= 0.3;
    else if (ContainsInsensitive(reputation, "respected") || ContainsInsensitive(reputation, "liked"))
        rate += 0.2;

    std::string political = ToLowerCopy(TrimCopy(scene.worldState.politicalStability));
    if (political == "unrest" || political == "rebellion")
        rate += 0.1;

    std::string aura = ToLowerCopy(TrimCopy(scene.playerContext.locationAura));
    if (aura == "friendly")
        rate += 0.1;
    else if (aura == "ominous")
        rate -= 0.2;

    return std::clamp(rate, 0.0, 1.0);
}

nlohmann::json NpcInitiative::ToJson() const
{
    return {
        {"npc_initiated", true},
        {"npc_id", npcId},
        {"npc_name", npcName},
        {"dialogue_theme", DialogueThemeName(theme)},
        {"dialogue_text", dialogueText},
        {"response_text", responseText},
        {"source", "npc_initiative"}};
}

IdleNpcManager::IdleNpcManager(IdleNpcSettings settings,
                               std::shared_ptr<Clock> clock,
                               std::shared_ptr<DialogueGenerator> dialogueGenerator,
                               std::shared_ptr<EventSink> eventSink)
    : settings_(settings),
      clock_(std::move(clock)),
      dialogueGenerator_(std::move(dialogueGenerator)),
      eventSink_(std::move(eventSink))
{
}

InitiativeCheck IdleNpcManager::ShouldInitiate(std::string const& npcId, SceneContext const& scene, Duration idleDuration,
                                               RandomSource& rng) const
{
    InitiativeCheck check;

    NpcProfile const* npc = scene.FindNpc(npcId);
    if (!npc)
        return check;

    std::chrono::seconds threshold(npc->idleThresholdSeconds.value_or(settings_.minIdleSeconds));
    if (idleDuration < threshold)
        return check;

    if (sessionInitiativeCount_ >= settings_.maxInitiativesPerSession)
        return check;

    auto it = history_.find(npcId);
    if (it != history_.end() &&
        Elapsed(it->second.lastInitiatedAt, clock_->Now()) < std::chrono::seconds(settings_.npcCooldownSeconds))
        return check;

    double rate = InitiativeRate(*npc, scene, idleDuration, settings_);
    if (rng.NextUnit() >= rate)
    {
        DIRECTOR_LOG_DEBUG(kNpcCategory, "[IdleNpc] {} stays quiet (chance {:.2f})", npcId, rate);
        return check;
    }

    check.initiate = true;
    check.theme = SelectDialogueTheme(*npc, scene);
    return check;
}

std::optional<NpcInitiative> IdleNpcManager::GenerateInitiative(std::string const& npcId, DialogueTheme theme,
                                                                SceneContext const& scene)
{
    if (!dialogueGenerator_)
        return std::nullopt;

    NpcProfile const* npc = scene.FindNpc(npcId);
    std::string npcName = npc ? npc->DisplayName() : TitleFromIdentifier(npcId);

    std::string dialogue;
    try
    {
        dialogue = TrimCopy(dialogueGenerator_->Generate(npcId, ThemeTopics(theme), scene));
    }
    catch (std::exception const& ex)
    {
        ++generatorFailures_;
        DIRECTOR_LOG_WARN(kNpcCategory, "[IdleNpc] Error generating initiative for {} ({}): {}", npcId,
                          FailureKindName(FailureKind::Collaborator), ex.what());
        return std::nullopt;
    }
    if (dialogue.empty())
    {
        ++generatorFailures_;
        DIRECTOR_LOG_DEBUG(kNpcCategory, "[IdleNpc] Generator returned nothing for {}", npcId);
        return std::nullopt;
    }

    NpcInitiativeState& state = history_[npcId];
    state.lastInitiatedAt = clock_->Now();
    ++state.initiativeCount;
    ++sessionInitiativeCount_;

    NpcInitiative initiative;
    initiative.npcId = npcId;
    initiative.npcName = npcName;
    initiative.theme = theme;
    initiative.dialogueText = dialogue;
    initiative.responseText = fmt::format("{} {}", npcName, dialogue);

    DIRECTOR_LOG_INFO(kNpcCategory, "[IdleNpc] NPC {} initiated dialogue with theme: {}", npcName, DialogueThemeName(theme));

    EventRecord record;
    record.sessionId = scene.sessionId;
    record.eventType = "NPC_INITIATED_DIALOGUE";
    record.actor = npcId;
    record.context = {
        {"npc_name", npcName},
        {"dialogue_theme", DialogueThemeName(theme)},
        {"dialogue_text", dialogue},
        {"location", scene.playerContext.locationId},
        {"initiative_count", sessionInitiativeCount_}};
    EmitEvent(eventSink_.get(), record, kNpcCategory);
    return initiative;
}

std::optional<NpcInitiative> IdleNpcManager::CheckScene(SceneContext const& scene, Duration idleDuration, RandomSource& rng)
{
    for (auto const& npc : scene.presentNpcs)
    {
        InitiativeCheck check = ShouldInitiate(npc.npcId, scene, idleDuration, rng);
        if (check.initiate && check.theme)
            return GenerateInitiative(npc.npcId, *check.theme, scene);
    }
    return std::nullopt;
}

std::optional<NpcInitiativeState> IdleNpcManager::StateFor(std::string const& npcId) const
{
    auto it = history_.find(npcId);
    if (it == history_.end())
        return std::nullopt;
    return it->second;
}

nlohmann::json IdleNpcManager::GetStatistics() const
{
    nlohmann::json history = nlohmann::json::object();
    for (auto const& [npcId, state] : history_)
    {
        history[npcId] = {
            {"last_initiated_at", FormatUtcIso(state.lastInitiatedAt)},
            {"initiative_count", state.initiativeCount}};
    }
    return {
        {"session_initiative_count", sessionInitiativeCount_},
        {"unique_npcs_initiated", history_.size()},
        {"npc_initiative_history", history},
        {"generator_failures", generatorFailures_},
        {"configuration", {
            {"minimum_idle_seconds", settings_.minIdleSeconds},
            {"maximum_idle_seconds", settings_.maxIdleSeconds},
            {"npc_cooldown_seconds", settings_.npcCooldownSeconds},
            {"max_initiatives_per_session", settings_.maxInitiativesPerSession}}}};
}
