#pragma once

#include "Ai/Collaborators.h"
#include "Config/DirectorConfig.h"
#include "Pacing/EventLedger.h"
#include "Util/Clock.h"
#include "Util/DirectorErrors.h"
#include "Util/RandomSource.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// A story event offered to the summarizer. Only allow-listed types are kept.
struct StoryEvent
{
    std::string eventType;
    std::string actor;
    nlohmann::json context = nlohmann::json::object();
    // Derived from the type and context when absent.
    std::optional<std::string> description;
};

struct StorySummary
{
    std::string text;
    TimePoint lastUpdatedAt;
};

// What the host folds into its next LLM prompt.
struct StoryContext
{
    std::string summary;
    std::vector<EventLedgerEntry> recentEvents;
    size_t pendingEvents = 0;

    bool HasSummary() const { return !summary.empty(); }
    nlohmann::json ToJson() const;
};

struct SummaryOutcome
{
    std::string text;
    bool usedFallback = false;
    // Why the collaborator result was not used; empty on the collaborator path.
    std::string fallbackReason;
    // Empty when no provider is configured.
    std::optional<FailureKind> failureKind;
    size_t eventsSummarized = 0;
    size_t tokensSaved = 0;
};

class EventSummarizer
{
public:
    EventSummarizer(SummarySettings settings,
                    std::shared_ptr<Clock> clock,
                    std::shared_ptr<SummaryProvider> summaryProvider = nullptr,
                    std::shared_ptr<EventSink> eventSink = nullptr);

    // Returns whether the event made it into the ledger.
    bool AddEvent(StoryEvent const& event);

    // Cooldown, event count and token cost all satisfied. Pure.
    bool ShouldSummarize() const;

    // Condense the ledger into a new running summary. Bounded by the configured
    // timeout; falls back to a rule-based digest on any collaborator problem.
    // Returns nothing only when the ledger is empty.
    std::optional<SummaryOutcome> CreateSummary(std::string const& sessionId, RandomSource& rng);

    StoryContext GetStoryContext() const;
    std::string BuildPrompt() const;
    std::string BuildEventLog() const;

    EventLedger const& Ledger() const { return ledger_; }
    std::optional<StorySummary> const& CurrentSummary() const { return summary_; }
    nlohmann::json GetStatistics() const;

    // Ledger significance for an allow-listed event; nothing when the event is filtered out.
    static std::optional<int> SignificanceFor(StoryEvent const& event);
    static std::string DescribeEvent(StoryEvent const& event);
    // Attack commands are combat, talk commands and NPC initiatives are dialogue,
    // branch events are quest progress.
    static EventKind KindFor(StoryEvent const& event);

private:
    std::optional<std::string> RequestSummary(std::string const& prompt, std::string& failure) const;
    std::string ValidateSummaryText(std::string const& text) const;
    std::string FallbackSummary(RandomSource& rng) const;

    SummarySettings settings_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<SummaryProvider> summaryProvider_;
    std::shared_ptr<EventSink> eventSink_;

    EventLedger ledger_;
    std::optional<StorySummary> summary_;
    TimePoint lastSummaryAt_;

    uint64_t summariesCreated_ = 0;
    uint64_t eventsSummarized_ = 0;
    uint64_t tokensSavedEstimate_ = 0;
    uint64_t fallbackSummaries_ = 0;
    uint64_t rejectedEvents_ = 0;
};
