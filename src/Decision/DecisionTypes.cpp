#include "Decision/DecisionTypes.h"
#include "Util/TextUtil.h"

char const* DecisionPriorityName(DecisionPriority priority)
{
    switch (priority)
    {
        case DecisionPriority::OpportunityAlignment:
            return "LLM_OPPORTUNITY_ALIGNMENT";
        case DecisionPriority::BranchActionAlignment:
            return "LLM_BRANCH_ACTION_ALIGNMENT";
        case DecisionPriority::ParsedCommand:
            return "SUCCESSFUL_PARSED_COMMAND";
        case DecisionPriority::GeneralInterpretation:
            return "GENERAL_LLM_INTERPRETATION";
        case DecisionPriority::Fallback:
            return "PARSER_FAILURE_FALLBACK";
    }
    return "UNKNOWN";
}

char const* ActionOutcomeName(ActionOutcome outcome)
{
    switch (outcome)
    {
        case ActionOutcome::Success:
            return "success";
        case ActionOutcome::Failure:
            return "failure";
        case ActionOutcome::PartialSuccess:
            return "partial_success";
        case ActionOutcome::RequiresFollowup:
            return "requires_followup";
        case ActionOutcome::Blocked:
            return "blocked";
        case ActionOutcome::Invalid:
            return "invalid";
    }
    return "invalid";
}

char const* ActionTypeName(ActionType type)
{
    switch (type)
    {
        case ActionType::OpportunityInitiation:
            return "opportunity_initiation";
        case ActionType::BranchAction:
            return "branch_action";
        case ActionType::ParsedCommand:
            return "parsed_command";
        case ActionType::GeneralInterpretation:
            return "general_interpretation";
        case ActionType::FallbackResponse:
            return "fallback_response";
    }
    return "fallback_response";
}

char const* OpportunityRejectionCode(OpportunityRejection rejection)
{
    switch (rejection)
    {
        case OpportunityRejection::ConditionsNotMet:
            return "conditions_not_met";
        case OpportunityRejection::AlreadyActive:
            return "already_active";
        case OpportunityRejection::WorldStateBlocking:
            return "world_state_blocking";
        case OpportunityRejection::PlayerStateBlocking:
            return "player_state_blocking";
    }
    return "conditions_not_met";
}

OpportunityRejection ParseOpportunityRejection(std::string const& message)
{
    std::string token = ToLowerCopy(TrimCopy(message));
    if (token == "already_active")
        return OpportunityRejection::AlreadyActive;
    if (token == "world_state_blocking")
        return OpportunityRejection::WorldStateBlocking;
    if (token == "player_state_blocking")
        return OpportunityRejection::PlayerStateBlocking;
    return OpportunityRejection::ConditionsNotMet;
}

size_t PriorityIndex(DecisionPriority priority)
{
    return static_cast<size_t>(priority) - 1;
}

size_t OutcomeIndex(ActionOutcome outcome)
{
    return static_cast<size_t>(outcome);
}

bool IsSentinelAlignment(std::optional<std::string> const& value)
{
    if (!value)
    {
        return true;
    }
    std::string token = ToLowerCopy(TrimCopy(*value));
    return token.empty() || token == "null" || token == "none";
}

std::optional<std::string> DecisionContext::MissingRequiredField() const
{
    if (TrimCopy(sessionId).empty())
    {
        return std::string("sessionId");
    }
    if (TrimCopy(playerId).empty())
    {
        return std::string("playerId");
    }
    return std::nullopt;
}

nlohmann::json ToJson(ActionResult const& result)
{
    nlohmann::json out = {
        {"outcome", ActionOutcomeName(result.outcome)},
        {"action_type", ActionTypeName(result.actionType)},
        {"details", result.details},
        {"mechanics_triggered", result.mechanicsTriggered},
        {"narrative_context", result.narrativeContext}};
    out["branch_id"] = result.branchId ? nlohmann::json(*result.branchId) : nlohmann::json(nullptr);
    out["error_message"] = result.errorMessage ? nlohmann::json(*result.errorMessage) : nlohmann::json(nullptr);
    out["failure_kind"] = result.failureKind ? nlohmann::json(FailureKindName(*result.failureKind)) : nlohmann::json(nullptr);
    return out;
}

nlohmann::json ToJson(DecisionResult const& result)
{
    nlohmann::json out = {
        {"priority_used", static_cast<int>(result.priorityUsed)},
        {"decision_priority", DecisionPriorityName(result.priorityUsed)},
        {"gm_response_base", result.gmResponseBase},
        {"narrative_enhancements", result.narrativeEnhancements},
        {"requires_followup", result.requiresFollowup},
        {"metadata", result.metadata}};
    out["action_result"] = result.actionResult ? ToJson(*result.actionResult) : nlohmann::json(nullptr);
    return out;
}

double DecisionStatsSnapshot::SuccessRate() const
{
    uint64_t successes = CountFor(ActionOutcome::Success);
    return static_cast<double>(successes) / static_cast<double>(total > 0 ? total : 1);
}

nlohmann::json DecisionStatsSnapshot::ToJson() const
{
    nlohmann::json priorities = nlohmann::json::object();
    for (size_t i = 0; i < kDecisionPriorityCount; ++i)
    {
        priorities[DecisionPriorityName(static_cast<DecisionPriority>(i + 1))] = byPriority[i];
    }
    nlohmann::json outcomes = nlohmann::json::object();
    for (size_t i = 0; i < kActionOutcomeCount; ++i)
    {
        outcomes[ActionOutcomeName(static_cast<ActionOutcome>(i))] = byOutcome[i];
    }
    return {
        {"total_decisions", total},
        {"priority_usage", priorities},
        {"action_outcomes", outcomes},
        {"branch_action_rejections", branchActionRejections},
        {"collaborator_failures", collaboratorFailures},
        {"validation_failures", validationFailures},
        {"success_rate", SuccessRate()}};
}
