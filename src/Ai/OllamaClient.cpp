#include "Ai/OllamaClient.h"
#include "Util/DirectorLog.h"
#include "Util/TextUtil.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <utility>

namespace
{
constexpr char const* kOllamaCategory = "director.ollama";

size_t AppendBody(void* data, size_t size, size_t count, void* target)
{
    size_t bytes = size * count;
    static_cast<std::string*>(target)->append(static_cast<char const*>(data), bytes);
    return bytes;
}

// Ollama answers with one JSON object per line when streaming, a single one otherwise.
std::string ExtractResponseText(std::string const& body)
{
    std::istringstream lines(body);
    std::string line;
    std::string text;
    while (std::getline(lines, line))
    {
        if (TrimCopy(line).empty())
            continue;
        try
        {
            nlohmann::json chunk = nlohmann::json::parse(line);
            auto piece = chunk.find("response");
            if (piece != chunk.end() && piece->is_string())
                text += piece->get<std::string>();
        }
        catch (nlohmann::json::exception const& ex)
        {
            DIRECTOR_LOG_TRACE(kOllamaCategory, "[Ollama] Skipping unparsable line: {}", ex.what());
        }
    }
    return text;
}
}

OllamaReply QueryOllamaLLM(OllamaSettings const& settings, std::string const& prompt)
{
    OllamaReply reply;

    CURL* curl = curl_easy_init();
    if (!curl)
    {
        reply.error = "Failed to initialize cURL";
        DIRECTOR_LOG_ERROR(kOllamaCategory, "[Ollama] {}.", reply.error);
        return reply;
    }

    // One JSON reply instead of a token stream.
    std::string payload = nlohmann::json{{"model", settings.model}, {"prompt", prompt}, {"stream", false}}.dump();

    curl_slist* headers = curl_slist_append(nullptr, "Content-Type: application/json");

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, settings.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, long(payload.length()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, long(settings.connectTimeoutMs));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, long(settings.requestTimeoutMs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode status = curl_easy_perform(curl);
    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (status != CURLE_OK)
    {
        reply.error = curl_easy_strerror(status);
        DIRECTOR_LOG_WARN(kOllamaCategory, "[Ollama] Failed to reach Ollama. cURL error: {}", reply.error);
        return reply;
    }
    if (httpCode < 200 || httpCode >= 300)
    {
        reply.error = "HTTP " + std::to_string(httpCode);
        DIRECTOR_LOG_WARN(kOllamaCategory, "[Ollama] Request rejected with {}.", reply.error);
        return reply;
    }

    reply.text = ExtractResponseText(body);
    reply.ok = !TrimCopy(reply.text).empty();
    if (!reply.ok)
    {
        reply.error = "empty response";
    }
    DIRECTOR_LOG_DEBUG(kOllamaCategory, "[Ollama] model={} prompt_chars={} reply_chars={}",
                       settings.model, prompt.size(), reply.text.size());
    return reply;
}

OllamaSummaryProvider::OllamaSummaryProvider(OllamaSettings settings)
    : settings_(std::move(settings))
{
}

SummaryResponse OllamaSummaryProvider::Summarize(std::string const& prompt)
{
    OllamaReply reply = QueryOllamaLLM(settings_, prompt);
    SummaryResponse response;
    response.success = reply.ok;
    response.content = TrimCopy(reply.text);
    response.error = reply.error;
    return response;
}
