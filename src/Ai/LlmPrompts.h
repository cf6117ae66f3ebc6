#pragma once

#include <string>

// Built-in prompts used when config values are empty.
// Slots: {event_log}, {previous_summary}.
const std::string& GetDefaultSummaryPrompt();

// Placeholder fed into {previous_summary} for a session's first digest.
const std::string& GetNoPreviousSummaryText();
