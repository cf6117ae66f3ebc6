#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// Failure taxonomy shared by the decision and pacing layers.
enum class FailureKind : uint8_t
{
    // A required context field is missing or a config value is unusable.
    Validation = 0,
    // Parser, interpreter, branch handler, dialogue generator, summarizer or
    // event sink failed or timed out.
    Collaborator = 1,
    // A narration template referenced a slot the scene could not fill.
    Templating = 2,
};

char const* FailureKindName(FailureKind kind);

// Raised by the config loader only; never escapes a decision or pacing call.
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(std::string const& message)
        : std::runtime_error(message) {}
};

// Raised by RenderTemplate when a slot has no value.
class TemplatingError : public std::runtime_error
{
public:
    explicit TemplatingError(std::string const& message)
        : std::runtime_error(message) {}
};
