#include "Pacing/PacingManager.h"
#include "Util/DirectorErrors.h"
#include "Util/DirectorLog.h"
#include "Util/TextTemplate.h"
#include "Util/TextUtil.h"

#include <cctype>
#include <map>
#include <utility>
#include <vector>

namespace
{
constexpr char const* kPacingCategory = "director.pacing";

using std::chrono::hours;
using std::chrono::minutes;

std::vector<std::string> const& TemplateFamily(AmbientTrigger trigger)
{
    static std::vector<std::string> const timePassage = {
        "Time passes quietly in {location_name}. {ambient_detail}",
        "The {time_of_day} continues its steady rhythm. {ambient_detail}",
        "Moments drift by peacefully. {ambient_detail}",
    };
    static std::vector<std::string> const locationAtmosphere = {
        "The atmosphere of {location_name} {atmospheric_verb}. {sensory_detail}",
        "{location_name} {location_mood_verb} around you. {ambient_sound}",
        "The essence of {location_name} {presence_verb}. {atmospheric_note}",
    };
    static std::vector<std::string> const worldStateHints = {
        "Distant {world_state_indicator} {reminder_verb} of the broader world's concerns.",
        "The ongoing {world_situation} {influence_verb} even this peaceful moment.",
        "Echoes of {world_events} {reach_verb} even here.",
    };
    static std::vector<std::string> const seasonalAtmospheric = {
        "The {season} air {seasonal_verb}. {seasonal_detail}",
        "{season} weather {weather_verb} the surroundings. {weather_effect}",
        "Nature's {season} rhythm {natural_verb}. {natural_observation}",
    };
    static std::vector<std::string> const npcAmbient = {
        "{npc_name} {npc_ambient_action} nearby. {npc_detail}",
        "You notice {npc_name} {npc_activity}. {npc_observation}",
        "In the background, {npc_name} {background_activity}.",
    };

    switch (trigger)
    {
        case AmbientTrigger::LocationBased:
            return locationAtmosphere;
        case AmbientTrigger::WorldStateBased:
            return worldStateHints;
        case AmbientTrigger::NpcBased:
            return npcAmbient;
        case AmbientTrigger::WeatherBased:
            return seasonalAtmospheric;
        case AmbientTrigger::TimeBased:
            break;
    }
    return timePassage;
}

// Slot name -> candidate fillers for slots the scene says nothing about. Kept
// in a fixed order so a seed replays exactly.
std::vector<std::pair<std::string, std::vector<std::string>>> const& TemplateDetails()
{
    static std::vector<std::pair<std::string, std::vector<std::string>>> const details = {
        {"ambient_detail", {"Light filters through in a mesmerizing pattern.", "The ambient sounds form a calming backdrop.",
                            "Everything feels momentarily still.", "The world continues its quiet rhythm."}},
        {"npc_ambient_action", {"moves about quietly", "tends to their own affairs", "goes about their business",
                                "works at some task", "pauses thoughtfully"}},
        {"npc_activity", {"engaged in quiet work", "lost in contemplation", "attending to daily tasks",
                          "focused on their own concerns"}},
        {"npc_detail", {"They seem absorbed in their own thoughts.", "Their movements have a practiced efficiency.",
                        "They occasionally glance in your direction."}},
        {"npc_observation", {"Their presence adds life to the scene.", "You wonder about their everyday life.",
                             "Their routine seems well-established."}},
        {"background_activity", {"continues with their day", "maintains their routine", "exists in their own world",
                                 "attends to various matters"}},
    };
    return details;
}

std::string AuraSound(std::string const& aura)
{
    static std::map<std::string, std::string> const sounds = {
        {"peaceful", "Gentle sounds create a soothing backdrop."},
        {"mysterious", "Strange whispers seem to echo from unseen places."},
        {"ominous", "An unsettling quiet dominates the atmosphere."},
        {"sacred", "Reverent silence fills the space."},
        {"bustling", "The sounds of activity provide constant background noise."},
    };
    auto it = sounds.find(aura);
    return it == sounds.end() ? "Subtle sounds drift through the air." : it->second;
}

struct SeasonWords
{
    char const* verb;
    char const* detail;
    char const* effect;
    char const* observation;
};

SeasonWords const& WordsForSeason(std::string const& season)
{
    static std::map<std::string, SeasonWords> const seasons = {
        {"spring", {"carries the promise of renewal", "New growth can be seen everywhere.",
                    "Everything seems touched with new possibility.", "Nature awakens with renewed vigor."}},
        {"summer", {"brings warmth and vitality", "The warmth is pleasant and energizing.",
                    "A pleasant warmth suffuses everything.", "The natural world hums with life."}},
        {"autumn", {"whispers of coming change", "Leaves rustle with the season's passage.",
                    "A sense of transition colors the scene.", "Nature prepares for its quiet rest."}},
        {"winter", {"brings a crisp clarity", "The cold is sharp but invigorating.",
                    "A crystalline clarity sharpens all details.", "Nature rests in peaceful dormancy."}},
    };
    static SeasonWords const other = {"moves with natural rhythm", "The season makes its presence known.",
                                      "The weather adds its own character.", "Nature follows its ancient patterns."};
    auto it = seasons.find(season);
    return it == seasons.end() ? other : it->second;
}

bool IsStable(std::string const& value)
{
    std::string token = ToLowerCopy(TrimCopy(value));
    return token.empty() || token == "stable";
}

std::string LocationLabel(PlayerContext const& player)
{
    if (!TrimCopy(player.locationName).empty())
        return TrimCopy(player.locationName);
    if (!TrimCopy(player.locationId).empty())
        return TitleFromIdentifier(player.locationId);
    return "This Place";
}

// Slots describing the aura that made the location worth narrating.
void FillLocationSlots(TemplateSlots& slots, PlayerContext const& player)
{
    std::string aura = ToLowerCopy(TrimCopy(player.locationAura));
    if (aura.empty() || aura == "neutral")
        aura = "peaceful";
    slots["atmospheric_verb"] = "feels " + aura;
    slots["location_mood_verb"] = "maintains its " + aura + " presence";
    slots["presence_verb"] = "carries a " + aura + " energy";
    slots["sensory_detail"] = "The " + aura + " atmosphere is tangible.";
    slots["ambient_sound"] = AuraSound(aura);
    slots["atmospheric_note"] = "Everything here speaks of " + aura + " intentions.";
}

// Political trouble outranks economic trouble.
void FillWorldStateSlots(TemplateSlots& slots, WorldState const& world)
{
    std::string political = ToLowerCopy(TrimCopy(world.politicalStability));
    std::string economic = ToLowerCopy(TrimCopy(world.economicStatus));
    if (!IsStable(political))
    {
        slots["world_state_indicator"] = "echoes of " + political;
        slots["world_situation"] = political + " political situation";
        slots["world_events"] = "the " + political + " times";
    }
    else if (!IsStable(economic))
    {
        slots["world_state_indicator"] = "signs of economic " + economic;
        slots["world_situation"] = "economic " + economic;
        slots["world_events"] = "the " + economic + " markets";
    }
    else
    {
        slots["world_state_indicator"] = "distant concerns";
        slots["world_situation"] = "state of the realm";
        slots["world_events"] = "faraway events";
    }
    slots["reminder_verb"] = "remind you";
    slots["influence_verb"] = "casts its shadow over";
    slots["reach_verb"] = "manage to reach";
}

void FillSeasonSlots(TemplateSlots& slots, WorldState const& world)
{
    std::string season = ToLowerCopy(TrimCopy(world.season));
    SeasonWords const& words = WordsForSeason(season);
    slots["seasonal_verb"] = words.verb;
    slots["seasonal_detail"] = words.detail;
    slots["weather_verb"] = season.empty() ? "shapes" : "brings " + season + "'s influence to";
    slots["weather_effect"] = words.effect;
    slots["natural_verb"] = "continues undisturbed";
    slots["natural_observation"] = words.observation;
}

std::string CapitalizeFirst(std::string text)
{
    if (!text.empty())
        text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
    return text;
}
}

char const* PacingStateName(PacingState state)
{
    switch (state)
    {
        case PacingState::Active:
            return "active";
        case PacingState::Settling:
            return "settling";
        case PacingState::Lull:
            return "lull";
        case PacingState::Stagnant:
            return "stagnant";
    }
    return "active";
}

char const* AmbientTriggerName(AmbientTrigger trigger)
{
    switch (trigger)
    {
        case AmbientTrigger::TimeBased:
            return "time_based";
        case AmbientTrigger::LocationBased:
            return "location_based";
        case AmbientTrigger::WorldStateBased:
            return "world_state_based";
        case AmbientTrigger::NpcBased:
            return "npc_based";
        case AmbientTrigger::WeatherBased:
            return "weather_based";
    }
    return "time_based";
}

size_t PacingMetrics::InteractionsWithinHour(TimePoint now) const
{
    size_t count = 0;
    for (TimePoint at : recentInteractions)
    {
        if (at <= now && Elapsed(at, now) < hours(1))
            ++count;
    }
    return count;
}

ActivityReport ActivityReport::FromDecision(DecisionResult const& decision, std::string locationId)
{
    ActivityReport report;
    report.priority = decision.priorityUsed;
    if (decision.actionResult)
    {
        report.outcome = decision.actionResult->outcome;
        report.actionType = decision.actionResult->actionType;
        report.mechanicsTriggered = decision.actionResult->mechanicsTriggered;
    }
    report.locationId = std::move(locationId);
    return report;
}

bool ActivityReport::IsSignificant() const
{
    if (priority == DecisionPriority::OpportunityAlignment || priority == DecisionPriority::BranchActionAlignment)
        return true;
    if (outcome == ActionOutcome::Success && mechanicsTriggered)
        return true;
    return attitudeShift;
}

bool ActivityReport::IsBranchProgression() const
{
    if (outcome != ActionOutcome::Success || !actionType)
        return false;
    return *actionType == ActionType::OpportunityInitiation || *actionType == ActionType::BranchAction;
}

PacingManager::PacingManager(PacingSettings settings, std::shared_ptr<Clock> clock, std::shared_ptr<EventSink> eventSink)
    : settings_(settings), clock_(std::move(clock)), eventSink_(std::move(eventSink))
{
    TimePoint now = clock_->Now();
    metrics_.lastSignificantEventAt = now;
    metrics_.lastBranchProgressionAt = now;
    metrics_.lastPlayerInputAt = now;
    // A fresh session may receive ambient narration right away.
    metrics_.lastAmbientInjectionAt = now - hours(1);
    metrics_.locationEnteredAt = now;
}

void PacingManager::UpdateActivity(ActivityReport const& report)
{
    TimePoint now = clock_->Now();
    metrics_.lastPlayerInputAt = now;

    if (report.IsSignificant())
    {
        metrics_.lastSignificantEventAt = now;
        DIRECTOR_LOG_DEBUG(kPacingCategory, "[Pacing] Significant event detected, resetting pacing timer");
    }
    if (report.IsBranchProgression())
    {
        metrics_.lastBranchProgressionAt = now;
        DIRECTOR_LOG_DEBUG(kPacingCategory, "[Pacing] Branch progression detected");
    }

    if (report.locationId != metrics_.locationId)
    {
        metrics_.locationId = report.locationId;
        metrics_.locationEnteredAt = now;
    }

    metrics_.recentInteractions.push_back(now);
    while (!metrics_.recentInteractions.empty() && Elapsed(metrics_.recentInteractions.front(), now) >= hours(1))
        metrics_.recentInteractions.pop_front();

    RefreshState(now);
}

void PacingManager::RecordSignificantEvent()
{
    TimePoint now = clock_->Now();
    metrics_.lastSignificantEventAt = now;
    RefreshState(now);
}

void PacingManager::RefreshState(TimePoint now)
{
    PacingState oldState = metrics_.currentPacingState;
    PacingState newState = ComputeState(now);
    if (oldState != newState)
    {
        metrics_.currentPacingState = newState;
        ++stateChanges_[static_cast<size_t>(newState)];
        DIRECTOR_LOG_INFO(kPacingCategory, "[Pacing] State changed: {} -> {}", PacingStateName(oldState), PacingStateName(newState));
    }
}

PacingState PacingManager::EvaluateState() const
{
    return ComputeState(clock_->Now());
}

PacingState PacingManager::ComputeState(TimePoint now) const
{
    if (Elapsed(metrics_.lastBranchProgressionAt, now) > minutes(settings_.stagnantMinutes))
        return PacingState::Stagnant;
    if (Elapsed(metrics_.lastSignificantEventAt, now) > minutes(settings_.lullMinutes))
        return PacingState::Lull;
    if (metrics_.InteractionsWithinHour(now) >= settings_.activeInteractionsPerHour)
        return PacingState::Active;
    return PacingState::Settling;
}

AmbientCheck PacingManager::ShouldInjectAmbient(SceneContext const& scene) const
{
    TimePoint now = clock_->Now();
    AmbientCheck check;

    if (Elapsed(metrics_.lastAmbientInjectionAt, now) < minutes(settings_.ambientCooldownMinutes))
        return check;

    PacingState state = ComputeState(now);
    if (state == PacingState::Lull || state == PacingState::Stagnant || ShouldInjectDespitePacing(scene, now))
    {
        check.inject = true;
        check.trigger = DetermineTrigger(scene);
    }
    return check;
}

bool PacingManager::ShouldInjectDespitePacing(SceneContext const& scene, TimePoint now) const
{
    if (LocationDuration(scene, now) > minutes(settings_.locationOverrideMinutes))
        return true;

    std::string political = ToLowerCopy(TrimCopy(scene.worldState.politicalStability));
    return political == "rebellion" || political == "war";
}

Duration PacingManager::LocationDuration(SceneContext const& scene, TimePoint now) const
{
    // A scene reporting a different location means the player moved since the last input.
    if (!scene.playerContext.locationId.empty() && scene.playerContext.locationId != metrics_.locationId)
        return Duration::zero();
    return Elapsed(metrics_.locationEnteredAt, now);
}

AmbientTrigger PacingManager::DetermineTrigger(SceneContext const& scene) const
{
    if (!scene.presentNpcs.empty())
        return AmbientTrigger::NpcBased;

    if (!IsStable(scene.worldState.politicalStability) || !IsStable(scene.worldState.economicStatus))
        return AmbientTrigger::WorldStateBased;

    std::string aura = ToLowerCopy(TrimCopy(scene.playerContext.locationAura));
    if (!aura.empty() && aura != "neutral")
        return AmbientTrigger::LocationBased;

    std::string season = ToLowerCopy(TrimCopy(scene.worldState.season));
    if (season == "winter" || season == "autumn")
        return AmbientTrigger::WeatherBased;

    return AmbientTrigger::TimeBased;
}

std::optional<std::string> PacingManager::GenerateAmbientContent(AmbientTrigger trigger, SceneContext const& scene,
                                                                 RandomSource& rng)
{
    std::vector<std::string> const& family = TemplateFamily(trigger);
    std::string const& selected = family[rng.PickIndex(family.size())];

    TemplateSlots slots;
    slots["location_name"] = LocationLabel(scene.playerContext);
    if (!TrimCopy(scene.worldState.timeOfDay).empty())
        slots["time_of_day"] = TrimCopy(scene.worldState.timeOfDay);
    if (!TrimCopy(scene.worldState.season).empty())
        slots["season"] = TrimCopy(scene.worldState.season);

    for (auto const& detail : TemplateDetails())
        slots[detail.first] = detail.second[rng.PickIndex(detail.second.size())];

    switch (trigger)
    {
        case AmbientTrigger::NpcBased:
            if (!scene.presentNpcs.empty())
                slots["npc_name"] = scene.presentNpcs[rng.PickIndex(scene.presentNpcs.size())].DisplayName();
            break;
        case AmbientTrigger::LocationBased:
            FillLocationSlots(slots, scene.playerContext);
            break;
        case AmbientTrigger::WorldStateBased:
            FillWorldStateSlots(slots, scene.worldState);
            break;
        case AmbientTrigger::WeatherBased:
            FillSeasonSlots(slots, scene.worldState);
            break;
        case AmbientTrigger::TimeBased:
            break;
    }

    std::string content;
    try
    {
        content = CapitalizeFirst(RenderTemplate(selected, slots));
    }
    catch (TemplatingError const& ex)
    {
        ++templatingFailures_;
        DIRECTOR_LOG_WARN(kPacingCategory, "[Pacing] Error generating ambient content ({}, {}): {}",
                          AmbientTriggerName(trigger), FailureKindName(FailureKind::Templating), ex.what());
        return std::nullopt;
    }

    TimePoint now = clock_->Now();
    metrics_.lastAmbientInjectionAt = now;
    ++totalInjections_;
    ++triggerUsage_[static_cast<size_t>(trigger)];
    DIRECTOR_LOG_INFO(kPacingCategory, "[Pacing] Generated ambient content ({}): {}", AmbientTriggerName(trigger), content);

    EventRecord record;
    record.sessionId = scene.sessionId;
    record.eventType = "AMBIENT_CONTENT_INJECTED";
    record.actor = "game_master";
    record.context = {
        {"trigger", AmbientTriggerName(trigger)},
        {"content", content},
        {"location_id", scene.playerContext.locationId}};
    EmitEvent(eventSink_.get(), record, kPacingCategory);
    return content;
}

bool PacingManager::IsSessionStale() const
{
    return Elapsed(metrics_.lastPlayerInputAt, clock_->Now()) > minutes(settings_.sessionStaleMinutes);
}

nlohmann::json PacingManager::GetStatistics() const
{
    TimePoint now = clock_->Now();

    nlohmann::json triggers = nlohmann::json::object();
    for (size_t i = 0; i < kAmbientTriggerCount; ++i)
        triggers[AmbientTriggerName(static_cast<AmbientTrigger>(i))] = triggerUsage_[i];
    nlohmann::json changes = nlohmann::json::object();
    for (size_t i = 0; i < kPacingStateCount; ++i)
        changes[PacingStateName(static_cast<PacingState>(i))] = stateChanges_[i];

    auto seconds = [](Duration d) { return std::chrono::duration_cast<std::chrono::seconds>(d).count(); };
    return {
        {"current_pacing_state", PacingStateName(ComputeState(now))},
        {"recorded_pacing_state", PacingStateName(metrics_.currentPacingState)},
        {"seconds_since_significant_event", seconds(Elapsed(metrics_.lastSignificantEventAt, now))},
        {"seconds_since_branch_progression", seconds(Elapsed(metrics_.lastBranchProgressionAt, now))},
        {"seconds_in_location", seconds(Elapsed(metrics_.locationEnteredAt, now))},
        {"interactions_last_hour", metrics_.InteractionsWithinHour(now)},
        {"ambient_injections", totalInjections_},
        {"ambient_triggers", triggers},
        {"state_changes", changes},
        {"templating_failures", templatingFailures_}};
}
