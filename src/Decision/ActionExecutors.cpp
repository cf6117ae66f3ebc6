#include "Decision/ActionExecutors.h"
#include "Decision/SkillCheck.h"
#include "Util/DirectorLog.h"
#include "Util/TextUtil.h"

#include <array>
#include <utility>

namespace
{
constexpr char const* kDecisionCategory = "director.decision";

struct VerbOutcome
{
    char const* verb;
    char const* description;
};

constexpr std::array<VerbOutcome, 6> kVerbTable = {{
    {"look", "You observe your surroundings carefully."},
    {"take", "You pick up the item."},
    {"go", "You move in the specified direction."},
    {"attack", "You strike at your target."},
    {"use", "You use the item."},
    {"talk", "You engage in conversation."},
}};

nlohmann::json OptionalJson(std::optional<std::string> const& value)
{
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}
}

OpportunityInitiationExecutor::OpportunityInitiationExecutor(std::shared_ptr<BranchHandler> branchHandler,
                                                             std::shared_ptr<EventSink> eventSink)
    : branchHandler_(std::move(branchHandler)), eventSink_(std::move(eventSink))
{
}

ActionResult OpportunityInitiationExecutor::Execute(DecisionContext const& context, std::string const& opportunityId,
                                                    RandomSource& /*rng*/)
{
    ActionResult result;
    result.actionType = ActionType::OpportunityInitiation;

    if (!branchHandler_)
    {
        result.outcome = ActionOutcome::Invalid;
        result.errorMessage = "no branch handler attached";
        result.failureKind = FailureKind::Collaborator;
        result.details = {{"error", *result.errorMessage}};
        return result;
    }

    BranchInitiation initiation = branchHandler_->AttemptInitiate(opportunityId, context.playerId, context.sessionId);
    if (initiation.success)
    {
        result.outcome = ActionOutcome::Success;
        result.mechanicsTriggered = true;
        result.branchId = initiation.newBranchId;
        result.details = {
            {"opportunity_id", opportunityId},
            {"message", initiation.message},
            {"new_branch_id", OptionalJson(initiation.newBranchId)}};
        result.narrativeContext = {{"opportunity_accepted", true}, {"new_narrative_path", true}};

        EventRecord record;
        record.sessionId = context.sessionId;
        record.eventType = "NARRATIVE_BRANCH_INITIATED";
        record.actor = context.playerId;
        record.context = result.details;
        EmitEvent(eventSink_.get(), record, kDecisionCategory);
        return result;
    }

    // Rejections are normalized onto the fixed vocabulary.
    std::string code = OpportunityRejectionCode(ParseOpportunityRejection(initiation.message));
    result.outcome = ActionOutcome::Failure;
    result.errorMessage = code;
    result.details = {
        {"opportunity_id", opportunityId},
        {"failure_reason", code},
        {"handler_message", initiation.message}};
    result.narrativeContext = {{"opportunity_blocked", true}, {"reason", code}};
    return result;
}

BranchActionExecutor::BranchActionExecutor(DecisionSettings settings, std::shared_ptr<EventSink> eventSink)
    : settings_(settings), eventSink_(std::move(eventSink))
{
}

ActionResult BranchActionExecutor::Execute(DecisionContext const& context, std::string const& action, RandomSource& rng)
{
    SkillCheckResult check = RollSkillCheck(settings_, context.worldState, rng);

    ActionResult result;
    result.actionType = ActionType::BranchAction;
    result.mechanicsTriggered = true;
    result.branchId = context.currentBranchId;

    if (check.success)
    {
        result.outcome = ActionOutcome::Success;
        result.details = {
            {"action", action},
            {"skill_check", check.ToJson()},
            {"branch_progress", "advanced"}};
        result.narrativeContext = {
            {"action_successful", true},
            {"skill_check_passed", true},
            {"progress_made", true}};

        EventRecord record;
        record.sessionId = context.sessionId;
        record.eventType = "BRANCH_ACTION_EXECUTED";
        record.actor = context.playerId;
        record.context = {
            {"branch_id", OptionalJson(context.currentBranchId)},
            {"action", action},
            {"skill_check_result", check.ToJson()}};
        EmitEvent(eventSink_.get(), record, kDecisionCategory);
    }
    else
    {
        result.outcome = ActionOutcome::Failure;
        result.details = {
            {"action", action},
            {"skill_check", check.ToJson()},
            {"failure_reason", check.failureReason.value_or("Skill check failed")}};
        result.narrativeContext = {
            {"action_attempted", true},
            {"skill_check_failed", true},
            {"setback_occurred", true}};
    }

    DIRECTOR_LOG_DEBUG(kDecisionCategory, "[Decision] Skill check for {}: chance={:.2f} roll={} -> {}",
                       action, check.chance, check.roll, check.success ? "pass" : "fail");
    return result;
}

ParsedCommandExecutor::ParsedCommandExecutor(std::shared_ptr<EventSink> eventSink)
    : eventSink_(std::move(eventSink))
{
}

nlohmann::json ParsedCommandExecutor::DescribeVerb(std::string const& verb)
{
    std::string key = ToLowerCopy(TrimCopy(verb));
    for (auto const& entry : kVerbTable)
    {
        if (key == entry.verb)
            return {{"success", true}, {"description", entry.description}};
    }
    return {{"success", false}, {"description", "Action not recognized."}};
}

ActionResult ParsedCommandExecutor::Execute(DecisionContext const& context, std::string const& verb, RandomSource& /*rng*/)
{
    nlohmann::json execution = DescribeVerb(verb);
    bool success = execution.value("success", false);

    nlohmann::json target = nullptr;
    if (context.parsedCommand && context.parsedCommand->directObject)
        target = *context.parsedCommand->directObject;

    ActionResult result;
    result.actionType = ActionType::ParsedCommand;
    result.outcome = success ? ActionOutcome::Success : ActionOutcome::Failure;
    result.mechanicsTriggered = true;
    result.details = {
        {"command", verb},
        {"target", target},
        {"execution_result", execution}};
    result.narrativeContext = {{"command_executed", true}, {"mechanical_action", true}};

    if (success)
    {
        EventRecord record;
        record.sessionId = context.sessionId;
        record.eventType = "COMMAND_EXECUTED";
        record.actor = context.playerId;
        record.context = {{"action", verb}, {"target", target}, {"result", execution}};
        EmitEvent(eventSink_.get(), record, kDecisionCategory);
    }
    return result;
}

ActionResult GeneralInterpretationExecutor::Execute(DecisionContext const& context, std::string const& /*argument*/,
                                                    RandomSource& /*rng*/)
{
    std::string intent = "General interaction";
    std::string nature = "conversational";
    if (context.interpreterOutput)
    {
        intent = context.interpreterOutput->intentSummary.value_or(intent);
        nature = context.interpreterOutput->inputNature.value_or(nature);
    }

    ActionResult result;
    result.actionType = ActionType::GeneralInterpretation;
    result.outcome = ActionOutcome::Success;
    result.mechanicsTriggered = false;
    result.details = {{"intent", intent}, {"nature", nature}};
    result.narrativeContext = {{"conversational_response", true}, {"no_mechanics", true}};
    return result;
}

ActionResult FallbackResponseExecutor::Execute(DecisionContext const& context, std::string const& /*argument*/,
                                               RandomSource& /*rng*/)
{
    nlohmann::json parserError = nullptr;
    if (context.parsedCommand && context.parsedCommand->errorMessage)
        parserError = *context.parsedCommand->errorMessage;

    ActionResult result;
    result.actionType = ActionType::FallbackResponse;
    result.outcome = ActionOutcome::RequiresFollowup;
    result.mechanicsTriggered = false;
    result.details = {{"reason", "unclear_input"}, {"parser_error", parserError}};
    result.narrativeContext = {{"clarification_needed", true}, {"unclear_input", true}};
    return result;
}
