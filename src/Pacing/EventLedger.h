#pragma once

#include "Util/Clock.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// What a ledger entry was about, for the rule-based digest.
enum class EventKind : uint8_t
{
    General = 0,
    Combat,
    Dialogue,
    Quest
};

constexpr size_t kEventKindCount = 4;

struct EventLedgerEntry
{
    TimePoint timestamp;
    std::string eventType;
    std::string description;
    // 1 (trivial) .. 5 (story-defining).
    int significance = 1;
    EventKind kind = EventKind::General;

    nlohmann::json ToJson() const;
};

// Append-only list of rated events for one session. Cleared wholesale once a
// summary has absorbed it.
class EventLedger
{
public:
    void Append(EventLedgerEntry entry);
    void Clear();

    size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }
    std::vector<EventLedgerEntry> const& Entries() const { return entries_; }

    // Significance descending, then newest first.
    std::vector<EventLedgerEntry> Ranked() const;
    // Newest first, at most `count` entries.
    std::vector<EventLedgerEntry> MostRecent(size_t count) const;

    // Rough token cost of the pending descriptions (1.3 tokens per word).
    size_t EstimatedTokens() const;

private:
    std::vector<EventLedgerEntry> entries_;
};

size_t EstimateTokens(std::string const& text);
