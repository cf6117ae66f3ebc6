#include "Pacing/EventLedger.h"
#include "Util/TextUtil.h"

#include <algorithm>
#include <utility>

nlohmann::json EventLedgerEntry::ToJson() const
{
    return {
        {"timestamp", FormatUtcIso(timestamp)},
        {"event_type", eventType},
        {"description", description},
        {"significance", significance}};
}

void EventLedger::Append(EventLedgerEntry entry)
{
    entry.significance = std::clamp(entry.significance, 1, 5);
    entries_.push_back(std::move(entry));
}

void EventLedger::Clear()
{
    entries_.clear();
}

std::vector<EventLedgerEntry> EventLedger::Ranked() const
{
    std::vector<EventLedgerEntry> ranked = entries_;
    // Stable so equal (significance, timestamp) pairs keep a deterministic order.
    std::stable_sort(ranked.begin(), ranked.end(), [](EventLedgerEntry const& a, EventLedgerEntry const& b)
    {
        if (a.significance != b.significance)
            return a.significance > b.significance;
        return a.timestamp > b.timestamp;
    });
    return ranked;
}

std::vector<EventLedgerEntry> EventLedger::MostRecent(size_t count) const
{
    std::vector<EventLedgerEntry> recent(entries_.rbegin(), entries_.rend());
    std::stable_sort(recent.begin(), recent.end(), [](EventLedgerEntry const& a, EventLedgerEntry const& b)
    {
        return a.timestamp > b.timestamp;
    });
    if (recent.size() > count)
        recent.resize(count);
    return recent;
}

size_t EventLedger::EstimatedTokens() const
{
    size_t words = 0;
    for (auto const& entry : entries_)
        words += CountWords(entry.description);
    return static_cast<size_t>(static_cast<double>(words) * 1.3);
}

size_t EstimateTokens(std::string const& text)
{
    return static_cast<size_t>(static_cast<double>(CountWords(text)) * 1.3);
}
