#pragma once

#include <cstddef>
#include <string>

// Small string helpers shared by the decision and pacing layers.
std::string TrimCopy(std::string const& input);
std::string ToLowerCopy(std::string value);
bool ContainsInsensitive(std::string const& haystack, std::string const& needle);
bool EqualsInsensitive(std::string const& a, std::string const& b);

// "npc_old_marta" -> "Npc Old Marta".
std::string TitleFromIdentifier(std::string const& id);

size_t CountWords(std::string const& text);
size_t CountSentenceTerminators(std::string const& text);

// True when an LLM reply carries tool-call or JSON payloads instead of prose.
bool LooksLikeJsonOrToolBlock(std::string const& text);

// Convert escaped sequences from config files into literal characters.
std::string ExpandPromptEscapes(std::string const& value);
