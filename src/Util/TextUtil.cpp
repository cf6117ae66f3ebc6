#include "Util/TextUtil.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace
{
bool IsSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

char LowerChar(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool IsSentenceEnd(char c)
{
    return c == '.' || c == '!' || c == '?';
}

bool IsWordSeparator(char c)
{
    return c == '_' || c == '-' || c == ' ';
}

// Markers of a tool call or a JSON object leaking into prose.
constexpr std::array<char const*, 4> kToolMarkers = {"<tool_call>", "</tool_call>", "\"name\"", "\"arguments\""};
}

std::string TrimCopy(std::string const& input)
{
    auto first = std::find_if_not(input.begin(), input.end(), IsSpace);
    auto last = std::find_if_not(input.rbegin(), input.rend(), IsSpace).base();
    if (first >= last)
        return {};
    return std::string(first, last);
}

std::string ToLowerCopy(std::string value)
{
    for (char& c : value)
        c = LowerChar(c);
    return value;
}

bool ContainsInsensitive(std::string const& haystack, std::string const& needle)
{
    if (needle.empty())
        return false;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return LowerChar(a) == LowerChar(b); });
    return it != haystack.end();
}

bool EqualsInsensitive(std::string const& a, std::string const& b)
{
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](char x, char y) { return LowerChar(x) == LowerChar(y); });
}

std::string TitleFromIdentifier(std::string const& id)
{
    std::string title(id);
    bool capitalize = true;
    for (char& c : title)
    {
        if (IsWordSeparator(c))
        {
            c = ' ';
            capitalize = true;
            continue;
        }
        c = capitalize ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : LowerChar(c);
        capitalize = false;
    }
    return title;
}

size_t CountWords(std::string const& text)
{
    size_t words = 0;
    bool inWord = false;
    for (char c : text)
    {
        if (IsSpace(c))
        {
            inWord = false;
        }
        else if (!inWord)
        {
            inWord = true;
            ++words;
        }
    }
    return words;
}

size_t CountSentenceTerminators(std::string const& text)
{
    // "..." and "?!" end one sentence, not several.
    size_t sentences = 0;
    char previous = '\0';
    for (char c : text)
    {
        if (IsSentenceEnd(c) && !IsSentenceEnd(previous))
            ++sentences;
        previous = c;
    }
    return sentences;
}

bool LooksLikeJsonOrToolBlock(std::string const& text)
{
    std::string trimmed = TrimCopy(text);
    if (trimmed.empty())
        return false;
    if (trimmed.front() == '{' || trimmed.front() == '[')
        return true;
    return std::any_of(kToolMarkers.begin(), kToolMarkers.end(),
                       [&trimmed](char const* marker) { return trimmed.find(marker) != std::string::npos; });
}

std::string ExpandPromptEscapes(std::string const& value)
{
    std::string output;
    output.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i)
    {
        if (value[i] != '\\' || i + 1 >= value.size())
        {
            output.push_back(value[i]);
            continue;
        }

        char expanded = '\0';
        switch (value[i + 1])
        {
            case 'n': expanded = '\n'; break;
            case 'r': expanded = '\r'; break;
            case 't': expanded = '\t'; break;
            case '\\': expanded = '\\'; break;
            case '"': expanded = '"'; break;
            default: break;
        }

        if (expanded == '\0')
        {
            // Unknown escape; keep the backslash as written.
            output.push_back(value[i]);
            continue;
        }
        output.push_back(expanded);
        ++i;
    }
    return output;
}
