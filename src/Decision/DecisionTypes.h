#pragma once

#include "Util/DirectorErrors.h"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Priority ladder. The numeric value is the rule number reported to the host.
enum class DecisionPriority : uint8_t
{
    OpportunityAlignment = 1,
    BranchActionAlignment = 2,
    ParsedCommand = 3,
    GeneralInterpretation = 4,
    Fallback = 5
};

constexpr size_t kDecisionPriorityCount = 5;

enum class ActionOutcome : uint8_t
{
    Success = 0,
    Failure,
    PartialSuccess,
    RequiresFollowup,
    Blocked,
    Invalid
};

constexpr size_t kActionOutcomeCount = 6;

// Closed set of executors, one per ladder rule.
enum class ActionType : uint8_t
{
    OpportunityInitiation = 0,
    BranchAction,
    ParsedCommand,
    GeneralInterpretation,
    FallbackResponse
};

constexpr size_t kActionTypeCount = 5;

// Machine-readable reasons a branch handler may give for refusing an opportunity.
enum class OpportunityRejection : uint8_t
{
    ConditionsNotMet,
    AlreadyActive,
    WorldStateBlocking,
    PlayerStateBlocking
};

char const* DecisionPriorityName(DecisionPriority priority);
char const* ActionOutcomeName(ActionOutcome outcome);
char const* ActionTypeName(ActionType type);
char const* OpportunityRejectionCode(OpportunityRejection rejection);
// Unknown handler messages map to ConditionsNotMet.
OpportunityRejection ParseOpportunityRejection(std::string const& message);

size_t PriorityIndex(DecisionPriority priority);
size_t OutcomeIndex(ActionOutcome outcome);

struct ParsedCommand
{
    std::string action;
    std::optional<std::string> directObject;
    std::optional<std::string> errorMessage;
    // Parser found more than one object matching the phrase.
    bool ambiguous = false;

    bool HasError() const { return errorMessage.has_value(); }
    bool NeedsDisambiguation() const { return ambiguous; }
};

struct InterpreterOutput
{
    std::optional<std::string> alignedOpportunityId;
    std::optional<std::string> alignedBranchAction;
    std::optional<std::string> suggestedAcknowledgement;
    std::optional<std::string> intentSummary;
    // e.g. "conversational", "question", "roleplay".
    std::optional<std::string> inputNature;
    std::optional<float> confidence;
    std::optional<bool> requiresFollowup;
};

// Interpreters emit "null"/"none" strings when nothing aligned.
bool IsSentinelAlignment(std::optional<std::string> const& value);

struct WorldState
{
    std::string politicalStability = "stable";
    std::string economicStatus = "stable";
    std::string season = "spring";
    std::string timeOfDay = "day";
};

struct PlayerContext
{
    std::string locationId;
    std::string locationName;
    // Dominant aura of the location ("neutral", "mysterious", "ominous", ...).
    std::string locationAura;
    std::string reputationSummary;
};

struct OpportunityRef
{
    std::string opportunityId;
    std::string title;
};

struct DecisionContext
{
    std::string sessionId;
    std::string playerId;
    std::string rawInput;
    std::optional<ParsedCommand> parsedCommand;
    std::optional<InterpreterOutput> interpreterOutput;
    std::optional<std::string> currentBranchId;
    std::optional<std::string> currentStage;
    WorldState worldState;
    PlayerContext playerContext;
    std::vector<OpportunityRef> pendingOpportunities;

    // Name of the first missing required field, if any.
    std::optional<std::string> MissingRequiredField() const;
};

struct ActionResult
{
    ActionOutcome outcome = ActionOutcome::Invalid;
    ActionType actionType = ActionType::FallbackResponse;
    nlohmann::json details = nlohmann::json::object();
    bool mechanicsTriggered = false;
    std::optional<std::string> branchId;
    std::optional<std::string> errorMessage;
    // Empty for story-level rejections such as a refused opportunity.
    std::optional<FailureKind> failureKind;
    nlohmann::json narrativeContext = nlohmann::json::object();
};

struct DecisionResult
{
    DecisionPriority priorityUsed = DecisionPriority::Fallback;
    std::optional<ActionResult> actionResult;
    std::string gmResponseBase;
    std::vector<std::string> narrativeEnhancements;
    bool requiresFollowup = false;
    nlohmann::json metadata = nlohmann::json::object();
};

// Flat JSON view for the renderer / API layer.
nlohmann::json ToJson(ActionResult const& result);
nlohmann::json ToJson(DecisionResult const& result);

struct DecisionStatsSnapshot
{
    uint64_t total = 0;
    std::array<uint64_t, kDecisionPriorityCount> byPriority{};
    std::array<uint64_t, kActionOutcomeCount> byOutcome{};
    uint64_t branchActionRejections = 0;
    uint64_t collaboratorFailures = 0;
    uint64_t validationFailures = 0;

    uint64_t CountFor(DecisionPriority priority) const { return byPriority[PriorityIndex(priority)]; }
    uint64_t CountFor(ActionOutcome outcome) const { return byOutcome[OutcomeIndex(outcome)]; }
    double SuccessRate() const;
    nlohmann::json ToJson() const;
};
