#include "Ai/LlmPrompts.h"

const std::string &GetDefaultSummaryPrompt()
{
    // Default digest prompt used when config overrides are missing.
    static const std::string prompt = R"(You are an AI assistant that summarizes game events.

Recent Event Log:
{event_log}

Previous Summary (if any): {previous_summary}

Condense the new events and integrate them with the previous summary into a concise narrative recap of what has happened. Max 3-4 sentences.

Focus on:
- Major story developments and player achievements
- Important character interactions and relationships
- Significant world events or changes
- Player's overall progress and current situation

Provide a flowing narrative summary, not a list of events.)";
    return prompt;
}

const std::string &GetNoPreviousSummaryText()
{
    static const std::string text = "No previous summary.";
    return text;
}
