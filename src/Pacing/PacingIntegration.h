#pragma once

#include "Ai/Collaborators.h"
#include "Config/DirectorConfig.h"
#include "Decision/DecisionEngine.h"
#include "Decision/DecisionTypes.h"
#include "Pacing/EventSummarizer.h"
#include "Pacing/IdleNpcManager.h"
#include "Pacing/PacingManager.h"
#include "Pacing/SceneContext.h"
#include "Util/Clock.h"
#include "Util/RandomSource.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

struct AmbientInjection
{
    AmbientTrigger trigger = AmbientTrigger::TimeBased;
    std::string content;

    nlohmann::json ToJson() const;
};

// Host-reported reaction of the world to something the player did.
struct WorldReaction
{
    std::string targetEntity;
    bool attitudeShift = false;
    std::optional<std::string> description;
    nlohmann::json details = nlohmann::json::object();
};

// Per-session orchestrator: routes decision outcomes into the pacing,
// idle-NPC and summary components and exposes the polling entry points.
// Every entry point takes the session lock, so one session's writer and a
// housekeeping thread reading statistics never touch its state at once.
class PacingIntegration
{
public:
    PacingIntegration(std::string sessionId,
                      DirectorConfig const& config,
                      std::shared_ptr<Clock> clock,
                      DirectorCollaborators const& collaborators,
                      uint64_t seed);

    std::string const& SessionId() const { return sessionId_; }
    uint64_t Seed() const { return seed_; }

    // Decide one turn on the session's random stream and feed the outcome
    // through pacing and the ledger. Never throws.
    DecisionResult HandleTurn(DecisionEngine& engine, DecisionContext const& context);

    // Feed one completed decision turn.
    void OnResponse(DecisionContext const& context, DecisionResult const& decision);
    void RecordWorldReaction(WorldReaction const& reaction);

    std::optional<AmbientInjection> CheckAmbient(SceneContext const& scene);
    std::optional<NpcInitiative> CheckNpcInitiative(SceneContext const& scene);
    // Runs a summary pass only when the summarizer says one is due.
    std::optional<SummaryOutcome> CheckSummary();

    StoryContext GetStoryContext() const;
    // Lock-free; reads only the last input time.
    bool IsSessionStale() const;
    Duration IdleDuration() const;

    nlohmann::json GetStatistics() const;

private:
    void ApplyResponse(DecisionContext const& context, DecisionResult const& decision);
    void FeedSummarizer(DecisionContext const& context, DecisionResult const& decision);

    std::string sessionId_;
    std::shared_ptr<Clock> clock_;
    uint64_t seed_;
    Duration staleAfter_;

    mutable std::mutex mutex_;
    RandomSource rng_;
    PacingManager pacing_;
    IdleNpcManager idleNpcs_;
    EventSummarizer summarizer_;

    // Milliseconds since the epoch of the last player input.
    std::atomic<int64_t> lastInputMs_;
};
