#include "Pacing/PacingIntegration.h"
#include "Util/DirectorLog.h"
#include "Util/TextUtil.h"

#include <utility>

namespace
{
constexpr char const* kPacingCategory = "director.pacing";
constexpr char const* kDecisionCategory = "director.decision";

int64_t EpochMs(TimePoint when)
{
    return std::chrono::duration_cast<Duration>(when.time_since_epoch()).count();
}

std::string BranchNameFor(DecisionContext const& context, std::string const& opportunityId)
{
    for (auto const& opportunity : context.pendingOpportunities)
    {
        if (opportunity.opportunityId == opportunityId && !TrimCopy(opportunity.title).empty())
            return opportunity.title;
    }
    return TitleFromIdentifier(opportunityId);
}
}

nlohmann::json AmbientInjection::ToJson() const
{
    return {
        {"trigger", AmbientTriggerName(trigger)},
        {"content", content},
        {"source", "ambient"}};
}

PacingIntegration::PacingIntegration(std::string sessionId,
                                     DirectorConfig const& config,
                                     std::shared_ptr<Clock> clock,
                                     DirectorCollaborators const& collaborators,
                                     uint64_t seed)
    : sessionId_(std::move(sessionId)),
      clock_(std::move(clock)),
      seed_(seed),
      staleAfter_(std::chrono::minutes(config.pacing.sessionStaleMinutes)),
      rng_(seed),
      pacing_(config.pacing, clock_, collaborators.eventSink),
      idleNpcs_(config.idleNpc, clock_, collaborators.dialogueGenerator, collaborators.eventSink),
      summarizer_(config.summary, clock_, collaborators.summaryProvider, collaborators.eventSink),
      lastInputMs_(EpochMs(pacing_.Metrics().lastPlayerInputAt))
{
    DIRECTOR_LOG_DEBUG(kPacingCategory, "[Pacing] session={} created (seed={})", sessionId_, seed);
}

DecisionResult PacingIntegration::HandleTurn(DecisionEngine& engine, DecisionContext const& context)
{
    std::lock_guard<std::mutex> lock(mutex_);
    DecisionResult decision = engine.Decide(context, rng_);
    try
    {
        ApplyResponse(context, decision);
    }
    catch (std::exception const& ex)
    {
        DIRECTOR_LOG_ERROR(kDecisionCategory, "[Director] session={} pacing update failed: {}", sessionId_, ex.what());
    }
    return decision;
}

void PacingIntegration::OnResponse(DecisionContext const& context, DecisionResult const& decision)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ApplyResponse(context, decision);
}

void PacingIntegration::ApplyResponse(DecisionContext const& context, DecisionResult const& decision)
{
    pacing_.UpdateActivity(ActivityReport::FromDecision(decision, context.playerContext.locationId));
    lastInputMs_.store(EpochMs(pacing_.Metrics().lastPlayerInputAt));
    FeedSummarizer(context, decision);
}

void PacingIntegration::FeedSummarizer(DecisionContext const& context, DecisionResult const& decision)
{
    if (!decision.actionResult)
        return;

    ActionResult const& action = *decision.actionResult;
    StoryEvent event;
    event.actor = context.playerId;

    switch (action.actionType)
    {
        case ActionType::OpportunityInitiation:
        {
            if (action.outcome != ActionOutcome::Success)
                return;
            std::string opportunityId = action.details.value("opportunity_id", std::string());
            event.eventType = "NARRATIVE_BRANCH_INITIATED";
            event.context = {
                {"opportunity_id", opportunityId},
                {"branch_id", action.branchId.value_or("")},
                {"branch_name", BranchNameFor(context, opportunityId)}};
            break;
        }
        case ActionType::BranchAction:
        {
            if (action.outcome != ActionOutcome::Success && action.outcome != ActionOutcome::Failure)
                return;
            event.eventType = "BRANCH_ACTION_EXECUTED";
            event.context = {
                {"action", action.details.value("action", std::string())},
                {"branch_id", action.branchId.value_or("")},
                {"skill_check_result", action.details.value("skill_check", nlohmann::json::object())}};
            break;
        }
        case ActionType::ParsedCommand:
        {
            event.eventType = "COMMAND_EXECUTED";
            event.context = {
                {"action", action.details.value("command", std::string())},
                {"result", action.details.value("execution_result", nlohmann::json::object())}};
            break;
        }
        case ActionType::GeneralInterpretation:
        case ActionType::FallbackResponse:
            return;
    }

    summarizer_.AddEvent(event);
}

void PacingIntegration::RecordWorldReaction(WorldReaction const& reaction)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaction.attitudeShift)
        pacing_.RecordSignificantEvent();

    StoryEvent event;
    event.eventType = "WORLD_REACTION_ASSESSED";
    event.actor = reaction.targetEntity;
    event.description = reaction.description;
    event.context = reaction.details.is_object() ? reaction.details : nlohmann::json::object();
    event.context["target_entity"] = reaction.targetEntity.empty() ? "someone" : reaction.targetEntity;
    event.context["attitude_shift"] = reaction.attitudeShift;
    summarizer_.AddEvent(event);
}

std::optional<AmbientInjection> PacingIntegration::CheckAmbient(SceneContext const& scene)
{
    std::lock_guard<std::mutex> lock(mutex_);
    AmbientCheck check = pacing_.ShouldInjectAmbient(scene);
    if (!check.inject || !check.trigger)
        return std::nullopt;

    std::optional<std::string> content = pacing_.GenerateAmbientContent(*check.trigger, scene, rng_);
    if (!content)
        return std::nullopt;

    AmbientInjection injection;
    injection.trigger = *check.trigger;
    injection.content = std::move(*content);
    return injection;
}

Duration PacingIntegration::IdleDuration() const
{
    TimePoint lastInput{Duration(lastInputMs_.load())};
    return Elapsed(lastInput, clock_->Now());
}

bool PacingIntegration::IsSessionStale() const
{
    return IdleDuration() > staleAfter_;
}

std::optional<NpcInitiative> PacingIntegration::CheckNpcInitiative(SceneContext const& scene)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<NpcInitiative> initiative = idleNpcs_.CheckScene(scene, IdleDuration(), rng_);
    if (!initiative)
        return std::nullopt;

    StoryEvent event;
    event.eventType = "NPC_INITIATED_DIALOGUE";
    event.actor = initiative->npcId;
    event.context = {
        {"npc_name", initiative->npcName},
        {"dialogue_theme", DialogueThemeName(initiative->theme)}};
    summarizer_.AddEvent(event);
    return initiative;
}

std::optional<SummaryOutcome> PacingIntegration::CheckSummary()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!summarizer_.ShouldSummarize())
        return std::nullopt;
    return summarizer_.CreateSummary(sessionId_, rng_);
}

StoryContext PacingIntegration::GetStoryContext() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return summarizer_.GetStoryContext();
}

nlohmann::json PacingIntegration::GetStatistics() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"session_id", sessionId_},
        {"seed", seed_},
        {"session_stale", IsSessionStale()},
        {"pacing", pacing_.GetStatistics()},
        {"idle_npcs", idleNpcs_.GetStatistics()},
        {"summaries", summarizer_.GetStatistics()}};
}
