#include "Decision/DecisionEngine.h"
#include "Util/DirectorLog.h"
#include "Util/TextUtil.h"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace
{
constexpr char const* kDecisionCategory = "director.decision";

constexpr char const* kGeneralDefaultResponse = "I understand what you're getting at...";
constexpr char const* kErrorResponse = "I apologize, but I'm having trouble processing your request right now.";
constexpr char const* kErrorEnhancement = "Please try again with a different approach.";
constexpr char const* kFallbackEnhancement = "Perhaps you could try being more specific about what you want to do?";

std::array<char const*, 4> const kFallbackLines = {
    "I'm not quite sure what you're trying to do. Could you be more specific?",
    "Your intentions aren't entirely clear to me. Perhaps you could rephrase that?",
    "I want to help, but I need a clearer understanding of what you want to accomplish.",
    "That's an interesting thought. Could you elaborate on what you'd like to do?",
};

std::vector<std::string> const kOpportunitySuccessEnhancements = {
    "A new path opens before you.",
    "Your decision sets events in motion.",
    "The world responds to your choice.",
};

std::vector<std::string> const kOpportunityFailureEnhancements = {
    "Perhaps another time would be more suitable.",
    "The moment doesn't seem quite right for such an endeavor.",
    "Other considerations weigh on your mind.",
};

std::vector<std::string> const kBranchSuccessEnhancements = {
    "Your skills serve you well in this endeavor.",
    "Progress is made through careful action.",
    "Each step brings you closer to your goal.",
};

std::vector<std::string> const kBranchFailureEnhancements = {
    "Not every attempt meets with success.",
    "Experience is gained even through setbacks.",
    "The challenge proves more difficult than expected.",
};

std::vector<std::string> const kParsedCommandEnhancements = {
    "Your actions have immediate effect.",
    "The world responds to your direct approach.",
    "Simple actions often yield clear results.",
};

std::vector<std::string> const kGeneralEnhancements = {
    "Your thoughts are acknowledged and considered.",
    "The conversation flows naturally.",
    "Understanding builds between you and the world around you.",
};

char const* RejectionNarrative(OpportunityRejection rejection)
{
    switch (rejection)
    {
        case OpportunityRejection::ConditionsNotMet:
            return "but the circumstances don't seem quite right for that course of action";
        case OpportunityRejection::AlreadyActive:
            return "but you're already committed to another endeavor";
        case OpportunityRejection::WorldStateBlocking:
            return "but current events make that path unavailable";
        case OpportunityRejection::PlayerStateBlocking:
            return "but you're not in the right condition for such an undertaking";
    }
    return "but something prevents you from pursuing that path right now";
}

std::string Acknowledgement(DecisionContext const& context)
{
    if (context.interpreterOutput && context.interpreterOutput->suggestedAcknowledgement)
        return TrimCopy(*context.interpreterOutput->suggestedAcknowledgement);
    return {};
}

bool HasText(std::optional<std::string> const& value)
{
    return value && !TrimCopy(*value).empty();
}
}

DecisionEngine::DecisionEngine(DecisionSettings settings,
                               std::shared_ptr<BranchHandler> branchHandler,
                               std::shared_ptr<EventSink> eventSink,
                               uint64_t seed)
    : settings_(settings), branchHandler_(std::move(branchHandler)), rng_(seed)
{
    SetExecutor(std::make_unique<OpportunityInitiationExecutor>(branchHandler_, eventSink));
    SetExecutor(std::make_unique<BranchActionExecutor>(settings_, eventSink));
    SetExecutor(std::make_unique<ParsedCommandExecutor>(eventSink));
    SetExecutor(std::make_unique<GeneralInterpretationExecutor>());
    SetExecutor(std::make_unique<FallbackResponseExecutor>());
}

void DecisionEngine::SetExecutor(std::unique_ptr<ActionExecutor> executor)
{
    if (!executor)
        return;
    size_t slot = static_cast<size_t>(executor->Type());
    executors_[slot] = std::move(executor);
}

DecisionResult DecisionEngine::Decide(DecisionContext const& context)
{
    std::lock_guard<std::mutex> lock(rngMutex_);
    return Decide(context, rng_);
}

DecisionResult DecisionEngine::Decide(DecisionContext const& context, RandomSource& rng)
{
    DecisionResult result;

    if (auto missing = context.MissingRequiredField())
    {
        counters_.validationFailures.fetch_add(1, std::memory_order_relaxed);
        DIRECTOR_LOG_WARN(kDecisionCategory, "[Decision] Rejected context ({}): missing required field {}",
                          FailureKindName(FailureKind::Validation), *missing);
        result = MakeErrorDecision(FailureKind::Validation, fmt::format("Missing required field: {}", *missing));
        Record(result);
        return result;
    }

    DIRECTOR_LOG_INFO(kDecisionCategory, "[Decision] session={} input='{}'", context.sessionId, context.rawInput);
    try
    {
        result = Evaluate(context, rng);
    }
    catch (std::exception const& ex)
    {
        counters_.collaboratorFailures.fetch_add(1, std::memory_order_relaxed);
        DIRECTOR_LOG_ERROR(kDecisionCategory, "[Decision] Decision making error ({}): {}",
                           FailureKindName(FailureKind::Collaborator), ex.what());
        result = MakeErrorDecision(FailureKind::Collaborator, ex.what());
    }

    Record(result);
    DIRECTOR_LOG_DEBUG(kDecisionCategory, "[Decision] session={} priority={} outcome={}",
                       context.sessionId, DecisionPriorityName(result.priorityUsed),
                       result.actionResult ? ActionOutcomeName(result.actionResult->outcome) : "none");
    return result;
}

DecisionResult DecisionEngine::Evaluate(DecisionContext const& context, RandomSource& rng)
{
    auto const& interpreter = context.interpreterOutput;

    if (interpreter && !IsSentinelAlignment(interpreter->alignedOpportunityId))
        return DecideOpportunity(context, TrimCopy(*interpreter->alignedOpportunityId), rng);

    if (interpreter && !IsSentinelAlignment(interpreter->alignedBranchAction))
    {
        std::string action = TrimCopy(*interpreter->alignedBranchAction);
        std::string reason;
        if (ValidateBranchAction(context, action, reason))
            return DecideBranchAction(context, action, rng);

        // A stale suggestion never reaches the parser or the fallback rule.
        counters_.branchActionRejections.fetch_add(1, std::memory_order_relaxed);
        DIRECTOR_LOG_WARN(kDecisionCategory, "[Decision] Invalid branch action {} for current context: {}", action, reason);
        return DecideGeneral(context, rng, {{"rejected_branch_action", action}, {"rejection_reason", reason}});
    }

    if (context.parsedCommand && !context.parsedCommand->HasError() && !context.parsedCommand->NeedsDisambiguation())
        return DecideParsedCommand(context, rng);

    if (interpreter && HasText(interpreter->intentSummary))
        return DecideGeneral(context, rng, nlohmann::json::object());

    return DecideFallback(context, rng);
}

bool DecisionEngine::ValidateBranchAction(DecisionContext const& context, std::string const& action, std::string& reason)
{
    if (!HasText(context.currentBranchId))
    {
        reason = "no_active_branch";
        return false;
    }
    if (!HasText(context.currentStage))
    {
        reason = "no_active_stage";
        return false;
    }
    if (!branchHandler_)
    {
        reason = "no_branch_handler";
        return false;
    }

    std::vector<std::string> actions;
    try
    {
        actions = branchHandler_->GetStageActions(*context.currentBranchId, *context.currentStage);
    }
    catch (std::exception const& ex)
    {
        counters_.collaboratorFailures.fetch_add(1, std::memory_order_relaxed);
        DIRECTOR_LOG_WARN(kDecisionCategory, "[Decision] Stage action lookup failed for {}/{}: {}",
                          *context.currentBranchId, *context.currentStage, ex.what());
        reason = "stage_lookup_failed";
        return false;
    }

    bool listed = std::any_of(actions.begin(), actions.end(),
                              [&action](std::string const& candidate) { return EqualsInsensitive(TrimCopy(candidate), action); });
    if (!listed)
    {
        reason = "action_not_in_stage";
        return false;
    }
    return true;
}

ActionResult DecisionEngine::RunExecutor(ActionType type, DecisionContext const& context, std::string const& argument,
                                         RandomSource& rng)
{
    ActionExecutor* executor = executors_[static_cast<size_t>(type)].get();
    try
    {
        if (!executor)
            throw std::runtime_error(fmt::format("no executor registered for {}", ActionTypeName(type)));
        return executor->Execute(context, argument, rng);
    }
    catch (std::exception const& ex)
    {
        counters_.collaboratorFailures.fetch_add(1, std::memory_order_relaxed);
        DIRECTOR_LOG_ERROR(kDecisionCategory, "[Decision] Error executing {} ({}): {}", ActionTypeName(type),
                           FailureKindName(FailureKind::Collaborator), ex.what());
        ActionResult failed;
        failed.outcome = ActionOutcome::Invalid;
        failed.actionType = type;
        failed.errorMessage = ex.what();
        failed.failureKind = FailureKind::Collaborator;
        failed.details = {{"error", ex.what()}};
        return failed;
    }
}

DecisionResult DecisionEngine::DecideOpportunity(DecisionContext const& context, std::string const& opportunityId,
                                                 RandomSource& rng)
{
    DIRECTOR_LOG_INFO(kDecisionCategory, "[Decision] Priority 1: Attempting to initiate opportunity {}", opportunityId);

    ActionResult action = RunExecutor(ActionType::OpportunityInitiation, context, opportunityId, rng);
    std::string ack = Acknowledgement(context);

    DecisionResult result;
    result.priorityUsed = DecisionPriority::OpportunityAlignment;
    if (action.outcome == ActionOutcome::Success)
    {
        std::string message = TrimCopy(action.details.value("message", std::string()));
        if (!ack.empty() && !message.empty())
            result.gmResponseBase = ack + "\n\n" + message;
        else if (!message.empty())
            result.gmResponseBase = message;
        else
            result.gmResponseBase = ack.empty() ? "Your initiative opens up new possibilities..." : ack;
        result.narrativeEnhancements = kOpportunitySuccessEnhancements;
    }
    else if (action.outcome == ActionOutcome::Failure)
    {
        char const* narrative = RejectionNarrative(ParseOpportunityRejection(action.errorMessage.value_or("")));
        if (!ack.empty())
            result.gmResponseBase = fmt::format("{}, {}.", ack, narrative);
        else
            result.gmResponseBase = fmt::format("You consider that course of action, {}.", narrative);
        result.narrativeEnhancements = kOpportunityFailureEnhancements;
    }
    else
    {
        result.gmResponseBase = ack.empty() ? "Something interesting happens..." : ack;
    }

    result.requiresFollowup = action.outcome == ActionOutcome::RequiresFollowup;
    result.metadata = {
        {"opportunity_id", opportunityId},
        {"llm_confidence", context.interpreterOutput->confidence.value_or(0.5f)}};
    result.actionResult = std::move(action);
    return result;
}

DecisionResult DecisionEngine::DecideBranchAction(DecisionContext const& context, std::string const& action,
                                                  RandomSource& rng)
{
    DIRECTOR_LOG_INFO(kDecisionCategory, "[Decision] Priority 2: Executing branch action: {}", action);

    ActionResult executed = RunExecutor(ActionType::BranchAction, context, action, rng);

    DecisionResult result;
    result.priorityUsed = DecisionPriority::BranchActionAlignment;
    if (executed.outcome == ActionOutcome::Success)
    {
        result.gmResponseBase = fmt::format(
            "You successfully {}. Your efforts pay off as you make meaningful progress.", action);
        result.narrativeEnhancements = kBranchSuccessEnhancements;
    }
    else if (executed.outcome == ActionOutcome::Failure)
    {
        std::string reason = "the attempt falls short";
        auto check = executed.details.find("skill_check");
        if (check != executed.details.end() && check->contains("failure_reason") && (*check)["failure_reason"].is_string())
            reason = (*check)["failure_reason"].get<std::string>();
        result.gmResponseBase = fmt::format("You attempt to {}, but {}.", action, reason);
        result.narrativeEnhancements = kBranchFailureEnhancements;
    }
    else
    {
        result.gmResponseBase = fmt::format("You try to {}, but the outcome is unclear.", action);
        result.narrativeEnhancements = kBranchFailureEnhancements;
    }

    result.requiresFollowup = executed.outcome == ActionOutcome::RequiresFollowup;
    result.metadata = {
        {"branch_action", action},
        {"branch_id", context.currentBranchId.value_or("")},
        {"stage", context.currentStage.value_or("")}};
    result.actionResult = std::move(executed);
    return result;
}

DecisionResult DecisionEngine::DecideParsedCommand(DecisionContext const& context, RandomSource& rng)
{
    std::string verb = TrimCopy(context.parsedCommand->action);
    DIRECTOR_LOG_INFO(kDecisionCategory, "[Decision] Priority 3: Executing parsed command: {}", verb);

    ActionResult action = RunExecutor(ActionType::ParsedCommand, context, verb, rng);

    DecisionResult result;
    result.priorityUsed = DecisionPriority::ParsedCommand;
    result.gmResponseBase = "You complete the action.";
    auto execution = action.details.find("execution_result");
    if (execution != action.details.end() && execution->contains("description"))
        result.gmResponseBase = (*execution)["description"].get<std::string>();
    result.narrativeEnhancements = kParsedCommandEnhancements;
    result.requiresFollowup = false;
    result.metadata = {{"command_action", verb}};
    result.actionResult = std::move(action);
    return result;
}

DecisionResult DecisionEngine::DecideGeneral(DecisionContext const& context, RandomSource& rng, nlohmann::json metadata)
{
    DIRECTOR_LOG_INFO(kDecisionCategory, "[Decision] Priority 4: Using general interpretation");

    ActionResult action = RunExecutor(ActionType::GeneralInterpretation, context, std::string(), rng);
    std::string ack = Acknowledgement(context);

    DecisionResult result;
    result.priorityUsed = DecisionPriority::GeneralInterpretation;
    result.gmResponseBase = ack.empty() ? kGeneralDefaultResponse : ack;
    result.narrativeEnhancements = kGeneralEnhancements;

    nlohmann::json intent = nullptr;
    nlohmann::json nature = nullptr;
    if (context.interpreterOutput)
    {
        result.requiresFollowup = context.interpreterOutput->requiresFollowup.value_or(false);
        if (context.interpreterOutput->intentSummary)
            intent = *context.interpreterOutput->intentSummary;
        if (context.interpreterOutput->inputNature)
            nature = *context.interpreterOutput->inputNature;
    }
    metadata["intent_summary"] = intent;
    metadata["input_nature"] = nature;
    result.metadata = std::move(metadata);
    result.actionResult = std::move(action);
    return result;
}

DecisionResult DecisionEngine::DecideFallback(DecisionContext const& context, RandomSource& rng)
{
    DIRECTOR_LOG_INFO(kDecisionCategory, "[Decision] Priority 5: Using fallback response");

    ActionResult action = RunExecutor(ActionType::FallbackResponse, context, std::string(), rng);
    std::string ack = Acknowledgement(context);

    DecisionResult result;
    result.priorityUsed = DecisionPriority::Fallback;
    result.gmResponseBase = ack.empty() ? kFallbackLines[rng.PickIndex(kFallbackLines.size())] : ack;
    result.narrativeEnhancements = {kFallbackEnhancement};
    result.requiresFollowup = true;
    result.metadata = {{"fallback_reason", "parser_failure_and_llm_unclear"}};
    result.actionResult = std::move(action);
    return result;
}

DecisionResult DecisionEngine::MakeErrorDecision(FailureKind kind, std::string const& error) const
{
    ActionResult action;
    action.outcome = ActionOutcome::Invalid;
    action.actionType = ActionType::FallbackResponse;
    action.errorMessage = error;
    action.failureKind = kind;
    action.details = {{"error", error}};

    DecisionResult result;
    result.priorityUsed = DecisionPriority::Fallback;
    result.gmResponseBase = kErrorResponse;
    result.narrativeEnhancements = {kErrorEnhancement};
    result.requiresFollowup = true;
    result.metadata = {{"error", true}, {"failure_kind", FailureKindName(kind)}};
    result.actionResult = std::move(action);
    return result;
}

void DecisionEngine::Record(DecisionResult const& result)
{
    counters_.total.fetch_add(1, std::memory_order_relaxed);
    counters_.byPriority[PriorityIndex(result.priorityUsed)].fetch_add(1, std::memory_order_relaxed);
    ActionOutcome outcome = result.actionResult ? result.actionResult->outcome : ActionOutcome::Invalid;
    counters_.byOutcome[OutcomeIndex(outcome)].fetch_add(1, std::memory_order_relaxed);
}

DecisionStatsSnapshot DecisionEngine::GetStats() const
{
    DecisionStatsSnapshot snapshot;
    snapshot.total = counters_.total.load(std::memory_order_relaxed);
    for (size_t i = 0; i < kDecisionPriorityCount; ++i)
        snapshot.byPriority[i] = counters_.byPriority[i].load(std::memory_order_relaxed);
    for (size_t i = 0; i < kActionOutcomeCount; ++i)
        snapshot.byOutcome[i] = counters_.byOutcome[i].load(std::memory_order_relaxed);
    snapshot.branchActionRejections = counters_.branchActionRejections.load(std::memory_order_relaxed);
    snapshot.collaboratorFailures = counters_.collaboratorFailures.load(std::memory_order_relaxed);
    snapshot.validationFailures = counters_.validationFailures.load(std::memory_order_relaxed);
    return snapshot;
}
