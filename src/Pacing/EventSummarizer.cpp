#include "Pacing/EventSummarizer.h"
#include "Ai/LlmPrompts.h"
#include "Util/DirectorErrors.h"
#include "Util/DirectorLog.h"
#include "Util/TextTemplate.h"
#include "Util/TextUtil.h"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <future>
#include <initializer_list>
#include <thread>
#include <utility>

namespace
{
constexpr char const* kSummaryCategory = "director.summary";

std::array<char const*, 4> const kFallbackSummaryTemplates = {
    "The adventurer has been exploring the area, encountering various challenges and interacting with locals.",
    "After traveling through different locations, the hero has made progress in understanding the local situation.",
    "Recent events have included conversations with important figures and discoveries about the current state of affairs.",
    "The journey continues with new revelations about the world and its inhabitants as the adventurer moves forward.",
};

nlohmann::json const& ContextObject(StoryEvent const& event)
{
    static nlohmann::json const empty = nlohmann::json::object();
    return event.context.is_object() ? event.context : empty;
}

std::string ContextString(nlohmann::json const& context, char const* key, std::string const& fallback)
{
    auto it = context.find(key);
    if (it == context.end() || !it->is_string() || TrimCopy(it->get<std::string>()).empty())
        return fallback;
    return it->get<std::string>();
}

bool ContextFlag(nlohmann::json const& context, char const* outer, char const* inner)
{
    auto it = context.find(outer);
    if (it == context.end() || !it->is_object())
        return false;
    auto flag = it->find(inner);
    return flag != it->end() && flag->is_boolean() && flag->get<bool>();
}

std::string Humanize(std::string const& eventType)
{
    std::string text = ToLowerCopy(eventType);
    std::replace(text.begin(), text.end(), '_', ' ');
    return text;
}

bool VerbIs(std::string const& verb, std::initializer_list<char const*> names)
{
    return std::any_of(names.begin(), names.end(), [&verb](char const* name) { return verb == name; });
}
}

nlohmann::json StoryContext::ToJson() const
{
    nlohmann::json recent = nlohmann::json::array();
    for (auto const& entry : recentEvents)
        recent.push_back(entry.ToJson());
    return {
        {"story_summary", summary},
        {"recent_events", recent},
        {"has_summary", HasSummary()},
        {"events_since_summary", pendingEvents}};
}

EventSummarizer::EventSummarizer(SummarySettings settings,
                                 std::shared_ptr<Clock> clock,
                                 std::shared_ptr<SummaryProvider> summaryProvider,
                                 std::shared_ptr<EventSink> eventSink)
    : settings_(std::move(settings)),
      clock_(std::move(clock)),
      summaryProvider_(std::move(summaryProvider)),
      eventSink_(std::move(eventSink))
{
    if (TrimCopy(settings_.prompt).empty())
        settings_.prompt = GetDefaultSummaryPrompt();
    // Allow the first summary as soon as the ledger qualifies.
    lastSummaryAt_ = clock_->Now() - std::chrono::hours(24);
}

std::optional<int> EventSummarizer::SignificanceFor(StoryEvent const& event)
{
    if (event.eventType == "NARRATIVE_BRANCH_INITIATED")
        return 5;
    if (event.eventType == "BRANCH_ACTION_EXECUTED")
        return 4;
    if (event.eventType == "WORLD_REACTION_ASSESSED")
        return 3;
    if (event.eventType == "NPC_INITIATED_DIALOGUE")
        return 2;
    // Commands only count when they did something.
    if (event.eventType == "COMMAND_EXECUTED" && ContextFlag(ContextObject(event), "result", "success"))
        return 2;
    return std::nullopt;
}

std::string EventSummarizer::DescribeEvent(StoryEvent const& event)
{
    if (event.description && !TrimCopy(*event.description).empty())
        return TrimCopy(*event.description);

    nlohmann::json const& context = ContextObject(event);
    if (event.eventType == "NARRATIVE_BRANCH_INITIATED")
        return "Player began " + ContextString(context, "branch_name", "unknown quest");

    if (event.eventType == "BRANCH_ACTION_EXECUTED")
    {
        bool success = ContextFlag(context, "skill_check_result", "success");
        return fmt::format("Player {} attempted {}", success ? "successfully" : "unsuccessfully",
                           ContextString(context, "action", "an action"));
    }

    if (event.eventType == "WORLD_REACTION_ASSESSED")
        return "World reacted to player's interaction with " + ContextString(context, "target_entity", "someone");

    if (event.eventType == "NPC_INITIATED_DIALOGUE")
    {
        std::string actor = event.actor.empty() ? "Someone" : TitleFromIdentifier(event.actor);
        return fmt::format("{} initiated {} with player", ContextString(context, "npc_name", actor),
                           ContextString(context, "dialogue_theme", "conversation"));
    }

    return "Player " + Humanize(event.eventType);
}

EventKind EventSummarizer::KindFor(StoryEvent const& event)
{
    if (event.eventType == "NARRATIVE_BRANCH_INITIATED" || event.eventType == "BRANCH_ACTION_EXECUTED")
        return EventKind::Quest;
    if (event.eventType == "NPC_INITIATED_DIALOGUE")
        return EventKind::Dialogue;
    if (event.eventType == "COMMAND_EXECUTED")
    {
        std::string verb = ToLowerCopy(TrimCopy(ContextString(ContextObject(event), "action", "")));
        if (VerbIs(verb, {"attack", "fight", "strike"}))
            return EventKind::Combat;
        if (VerbIs(verb, {"talk", "ask", "say"}))
            return EventKind::Dialogue;
    }
    return EventKind::General;
}

bool EventSummarizer::AddEvent(StoryEvent const& event)
{
    std::optional<int> significance = SignificanceFor(event);
    if (!significance)
    {
        ++rejectedEvents_;
        DIRECTOR_LOG_TRACE(kSummaryCategory, "[Summary] Ignoring event {}", event.eventType);
        return false;
    }

    EventLedgerEntry entry;
    entry.timestamp = clock_->Now();
    entry.eventType = event.eventType;
    entry.description = DescribeEvent(event);
    entry.significance = *significance;
    entry.kind = KindFor(event);
    ledger_.Append(std::move(entry));

    DIRECTOR_LOG_DEBUG(kSummaryCategory, "[Summary] Added event for summarization: {} (pending={})",
                       event.eventType, ledger_.Size());
    return true;
}

bool EventSummarizer::ShouldSummarize() const
{
    if (Elapsed(lastSummaryAt_, clock_->Now()) < std::chrono::minutes(settings_.cooldownMinutes))
        return false;
    if (ledger_.Size() < settings_.minEvents)
        return false;
    return ledger_.EstimatedTokens() >= settings_.minTokens;
}

std::string EventSummarizer::BuildEventLog() const
{
    if (ledger_.Empty())
        return "No recent events to summarize.";

    std::string log;
    for (auto const& entry : ledger_.Ranked())
    {
        if (!log.empty())
            log += "\n";
        log += fmt::format("[{}] {} {}", FormatUtcMinute(entry.timestamp),
                           std::string(static_cast<size_t>(entry.significance), '*'), entry.description);
    }
    return log;
}

std::string EventSummarizer::BuildPrompt() const
{
    TemplateSlots slots;
    slots["event_log"] = BuildEventLog();
    slots["previous_summary"] = summary_ && !summary_->text.empty() ? summary_->text : GetNoPreviousSummaryText();
    return RenderTemplate(settings_.prompt, slots);
}

std::optional<std::string> EventSummarizer::RequestSummary(std::string const& prompt, std::string& failure) const
{
    std::shared_ptr<SummaryProvider> provider = summaryProvider_;
    auto promise = std::make_shared<std::promise<SummaryResponse>>();
    std::future<SummaryResponse> future = promise->get_future();

    // The worker owns everything it touches; a late reply after a timeout is discarded.
    std::thread([provider, prompt, promise]()
    {
        try
        {
            promise->set_value(provider->Summarize(prompt));
        }
        catch (std::exception const&)
        {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(settings_.timeoutMs)) != std::future_status::ready)
    {
        failure = "timeout";
        return std::nullopt;
    }

    SummaryResponse response;
    try
    {
        response = future.get();
    }
    catch (std::exception const& ex)
    {
        failure = std::string("exception: ") + ex.what();
        return std::nullopt;
    }

    if (!response.success)
    {
        failure = response.error.empty() ? "provider_failure" : response.error;
        return std::nullopt;
    }

    std::string text = TrimCopy(response.content);
    std::string invalid = ValidateSummaryText(text);
    if (!invalid.empty())
    {
        failure = invalid;
        return std::nullopt;
    }
    return text;
}

std::string EventSummarizer::ValidateSummaryText(std::string const& text) const
{
    if (text.empty())
        return "empty";
    if (LooksLikeJsonOrToolBlock(text))
        return "json_or_tool";
    if (CountSentenceTerminators(text) > settings_.maxSentences)
        return "too_many_sentences";
    if (text.size() > settings_.maxChars)
        return "too_long";
    return {};
}

std::string EventSummarizer::FallbackSummary(RandomSource& rng) const
{
    if (ledger_.Empty())
        return "No notable events have occurred recently.";

    std::array<size_t, kEventKindCount> counts{};
    size_t highSignificance = 0;
    for (auto const& entry : ledger_.Entries())
    {
        ++counts[static_cast<size_t>(entry.kind)];
        if (entry.significance >= 4)
            ++highSignificance;
    }

    size_t combat = counts[static_cast<size_t>(EventKind::Combat)];
    size_t dialogue = counts[static_cast<size_t>(EventKind::Dialogue)];
    size_t quest = counts[static_cast<size_t>(EventKind::Quest)];

    // The dominant kind wins; ties go to combat, then dialogue.
    if (combat > 0 && combat >= dialogue && combat >= quest)
        return "The adventurer has been engaged in various battles and conflicts, facing enemies and emerging victorious.";
    if (dialogue > 0 && dialogue >= quest)
        return "Important conversations have taken place, revealing crucial information and establishing relationships with key characters.";
    if (highSignificance >= 3)
        return "Major developments have occurred, drastically changing the course of the adventure and opening new possibilities.";
    if (quest > 0)
        return "New quests and adventures have begun, setting the hero on a path toward new discoveries and challenges.";

    return kFallbackSummaryTemplates[rng.PickIndex(kFallbackSummaryTemplates.size())];
}

std::optional<SummaryOutcome> EventSummarizer::CreateSummary(std::string const& sessionId, RandomSource& rng)
{
    if (ledger_.Empty())
        return std::nullopt;

    SummaryOutcome outcome;
    std::optional<std::string> text;

    if (!summaryProvider_)
    {
        outcome.fallbackReason = "no_provider";
    }
    else
    {
        std::string prompt;
        try
        {
            prompt = BuildPrompt();
        }
        catch (TemplatingError const& ex)
        {
            outcome.fallbackReason = std::string("prompt: ") + ex.what();
            outcome.failureKind = FailureKind::Templating;
        }
        if (!prompt.empty())
        {
            text = RequestSummary(prompt, outcome.fallbackReason);
            if (!text)
                outcome.failureKind = FailureKind::Collaborator;
        }
    }

    if (!text)
    {
        outcome.usedFallback = true;
        text = FallbackSummary(rng);
        ++fallbackSummaries_;
        DIRECTOR_LOG_WARN(kSummaryCategory, "[Summary] session={} using fallback summary ({}: {})", sessionId,
                          outcome.failureKind ? FailureKindName(*outcome.failureKind) : "unconfigured",
                          outcome.fallbackReason);
    }

    size_t originalTokens = ledger_.EstimatedTokens();
    size_t summaryTokens = EstimateTokens(*text);
    outcome.text = *text;
    outcome.eventsSummarized = ledger_.Size();
    outcome.tokensSaved = originalTokens > summaryTokens ? originalTokens - summaryTokens : 0;

    TimePoint now = clock_->Now();
    summary_ = StorySummary{outcome.text, now};
    lastSummaryAt_ = now;
    ++summariesCreated_;
    eventsSummarized_ += outcome.eventsSummarized;
    tokensSavedEstimate_ += outcome.tokensSaved;
    ledger_.Clear();

    DIRECTOR_LOG_INFO(kSummaryCategory, "[Summary] session={} created event summary from {} events, estimated {} tokens saved",
                      sessionId, outcome.eventsSummarized, outcome.tokensSaved);

    EventRecord record;
    record.sessionId = sessionId;
    record.eventType = "EVENT_SUMMARY_CREATED";
    record.actor = "game_master";
    record.context = {
        {"summary", outcome.text},
        {"events_summarized", outcome.eventsSummarized},
        {"tokens_saved", outcome.tokensSaved},
        {"fallback", outcome.usedFallback}};
    EmitEvent(eventSink_.get(), record, kSummaryCategory);
    return outcome;
}

StoryContext EventSummarizer::GetStoryContext() const
{
    StoryContext context;
    if (summary_)
        context.summary = summary_->text;
    context.recentEvents = ledger_.MostRecent(settings_.recentEventCount);
    context.pendingEvents = ledger_.Size();
    return context;
}

nlohmann::json EventSummarizer::GetStatistics() const
{
    double created = static_cast<double>(std::max<uint64_t>(1, summariesCreated_));
    return {
        {"total_summaries_created", summariesCreated_},
        {"total_events_summarized", eventsSummarized_},
        {"estimated_tokens_saved", tokensSavedEstimate_},
        {"fallback_summaries", fallbackSummaries_},
        {"rejected_events", rejectedEvents_},
        {"current_summary_length", summary_ ? summary_->text.size() : 0},
        {"events_pending_summarization", ledger_.Size()},
        {"pending_token_estimate", ledger_.EstimatedTokens()},
        {"last_summarization", FormatUtcIso(lastSummaryAt_)},
        {"cost_efficiency", {
            {"tokens_saved_per_summary", static_cast<double>(tokensSavedEstimate_) / created},
            {"events_per_summary", static_cast<double>(eventsSummarized_) / created}}}};
}
