#pragma once

#include "Ai/Collaborators.h"
#include "Config/DirectorConfig.h"
#include "Decision/DecisionTypes.h"
#include "Pacing/SceneContext.h"
#include "Util/Clock.h"
#include "Util/RandomSource.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

enum class PacingState : uint8_t
{
    Active = 0,  // recent significant activity
    Settling,    // activity slowing down
    Lull,        // extended quiet period
    Stagnant     // no branch progress, needs intervention
};

constexpr size_t kPacingStateCount = 4;

enum class AmbientTrigger : uint8_t
{
    TimeBased = 0,
    LocationBased,
    WorldStateBased,
    NpcBased,
    WeatherBased
};

constexpr size_t kAmbientTriggerCount = 5;

char const* PacingStateName(PacingState state);
char const* AmbientTriggerName(AmbientTrigger trigger);

struct PacingMetrics
{
    TimePoint lastSignificantEventAt;
    TimePoint lastBranchProgressionAt;
    TimePoint lastPlayerInputAt;
    TimePoint lastAmbientInjectionAt;
    TimePoint locationEnteredAt;
    std::string locationId;
    // Input timestamps inside the trailing hour, oldest first.
    std::deque<TimePoint> recentInteractions;
    PacingState currentPacingState = PacingState::Active;

    size_t InteractionsWithinHour(TimePoint now) const;
};

// What one decision turn tells the pacing layer.
struct ActivityReport
{
    DecisionPriority priority = DecisionPriority::Fallback;
    std::optional<ActionOutcome> outcome;
    std::optional<ActionType> actionType;
    bool mechanicsTriggered = false;
    bool attitudeShift = false;
    std::string locationId;

    static ActivityReport FromDecision(DecisionResult const& decision, std::string locationId);

    bool IsSignificant() const;
    bool IsBranchProgression() const;
};

struct AmbientCheck
{
    bool inject = false;
    std::optional<AmbientTrigger> trigger;
};

// Per-session pacing state machine and ambient narration source.
class PacingManager
{
public:
    PacingManager(PacingSettings settings, std::shared_ptr<Clock> clock, std::shared_ptr<EventSink> eventSink = nullptr);

    void UpdateActivity(ActivityReport const& report);
    // Significant world change that did not come from a player turn.
    void RecordSignificantEvent();

    // State as of the clock's current time; does not touch the recorded state.
    PacingState EvaluateState() const;
    PacingState CurrentState() const { return metrics_.currentPacingState; }

    // Always (false, none) inside the ambient cooldown.
    AmbientCheck ShouldInjectAmbient(SceneContext const& scene) const;

    // Fills a template from the trigger's family. Returns nothing when a slot
    // cannot be filled; the failure is logged and counted.
    std::optional<std::string> GenerateAmbientContent(AmbientTrigger trigger, SceneContext const& scene, RandomSource& rng);

    bool IsSessionStale() const;

    PacingMetrics const& Metrics() const { return metrics_; }
    nlohmann::json GetStatistics() const;

private:
    PacingState ComputeState(TimePoint now) const;
    void RefreshState(TimePoint now);
    AmbientTrigger DetermineTrigger(SceneContext const& scene) const;
    bool ShouldInjectDespitePacing(SceneContext const& scene, TimePoint now) const;
    Duration LocationDuration(SceneContext const& scene, TimePoint now) const;

    PacingSettings settings_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> eventSink_;
    PacingMetrics metrics_;

    uint64_t totalInjections_ = 0;
    uint64_t templatingFailures_ = 0;
    std::array<uint64_t, kAmbientTriggerCount> triggerUsage_{};
    std::array<uint64_t, kPacingStateCount> stateChanges_{};
};
