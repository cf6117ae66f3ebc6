#pragma once

#include "Ai/Collaborators.h"
#include "Config/DirectorConfig.h"
#include "Decision/ActionExecutors.h"
#include "Decision/DecisionTypes.h"
#include "Util/RandomSource.h"

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

// Top-level arbiter. Applies the fixed five-rule ladder to a context and runs
// exactly one executor. Shared across sessions; only the counters are mutable.
class DecisionEngine
{
public:
    DecisionEngine(DecisionSettings settings,
                   std::shared_ptr<BranchHandler> branchHandler,
                   std::shared_ptr<EventSink> eventSink = nullptr,
                   uint64_t seed = 0x5eed);

    // Never throws. Uses the caller's random stream (one per session).
    DecisionResult Decide(DecisionContext const& context, RandomSource& rng);
    // Same, drawing from the engine's own stream.
    DecisionResult Decide(DecisionContext const& context);

    // Replace the executor for executor->Type(). Not safe while decisions are in flight.
    void SetExecutor(std::unique_ptr<ActionExecutor> executor);

    DecisionStatsSnapshot GetStats() const;

private:
    struct Counters
    {
        std::atomic<uint64_t> total{0};
        std::array<std::atomic<uint64_t>, kDecisionPriorityCount> byPriority{};
        std::array<std::atomic<uint64_t>, kActionOutcomeCount> byOutcome{};
        std::atomic<uint64_t> branchActionRejections{0};
        std::atomic<uint64_t> collaboratorFailures{0};
        std::atomic<uint64_t> validationFailures{0};
    };

    DecisionResult Evaluate(DecisionContext const& context, RandomSource& rng);

    DecisionResult DecideOpportunity(DecisionContext const& context, std::string const& opportunityId, RandomSource& rng);
    DecisionResult DecideBranchAction(DecisionContext const& context, std::string const& action, RandomSource& rng);
    DecisionResult DecideParsedCommand(DecisionContext const& context, RandomSource& rng);
    DecisionResult DecideGeneral(DecisionContext const& context, RandomSource& rng, nlohmann::json metadata);
    DecisionResult DecideFallback(DecisionContext const& context, RandomSource& rng);

    // Stage re-check for a suggested branch action. Fills `reason` on rejection.
    bool ValidateBranchAction(DecisionContext const& context, std::string const& action, std::string& reason);

    // Runs an executor, turning a thrown collaborator error into an INVALID result.
    ActionResult RunExecutor(ActionType type, DecisionContext const& context, std::string const& argument, RandomSource& rng);

    DecisionResult MakeErrorDecision(FailureKind kind, std::string const& error) const;
    void Record(DecisionResult const& result);

    DecisionSettings settings_;
    std::shared_ptr<BranchHandler> branchHandler_;
    std::array<std::unique_ptr<ActionExecutor>, kActionTypeCount> executors_;
    Counters counters_;

    std::mutex rngMutex_;
    RandomSource rng_;
};
