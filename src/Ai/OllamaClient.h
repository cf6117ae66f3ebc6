#pragma once

#include "Ai/Collaborators.h"
#include "Config/DirectorConfig.h"

#include <string>

struct OllamaReply
{
    bool ok = false;
    std::string text;
    std::string error;
};

// Submit a prompt to Ollama and return the concatenated response text.
// Blocking; bounded by the connect and request timeouts in `settings`.
OllamaReply QueryOllamaLLM(OllamaSettings const& settings, std::string const& prompt);

// Summarize collaborator backed by an Ollama /api/generate endpoint.
class OllamaSummaryProvider : public SummaryProvider
{
public:
    explicit OllamaSummaryProvider(OllamaSettings settings);

    SummaryResponse Summarize(std::string const& prompt) override;

private:
    OllamaSettings settings_;
};
