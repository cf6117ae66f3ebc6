#pragma once

#include "Pacing/SceneContext.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

// Interfaces to the services that surround the director. Implementations may
// throw; every call site catches at the boundary and degrades.

struct BranchInitiation
{
    bool success = false;
    // Handler message on success; a rejection code on failure.
    std::string message;
    std::optional<std::string> newBranchId;
};

class BranchHandler
{
public:
    virtual ~BranchHandler() = default;

    virtual BranchInitiation AttemptInitiate(std::string const& opportunityId,
                                             std::string const& playerId,
                                             std::string const& sessionId) = 0;

    // Actions legal for the stage the branch is in right now.
    virtual std::vector<std::string> GetStageActions(std::string const& branchId,
                                                     std::string const& stageId) = 0;
};

struct SummaryResponse
{
    bool success = false;
    std::string content;
    std::string error;
};

// The interpreter's summarize entry point. May block; callers bound it with a timeout.
class SummaryProvider
{
public:
    virtual ~SummaryProvider() = default;
    virtual SummaryResponse Summarize(std::string const& prompt) = 0;
};

class DialogueGenerator
{
public:
    virtual ~DialogueGenerator() = default;
    virtual std::string Generate(std::string const& npcId,
                                 std::vector<std::string> const& topics,
                                 SceneContext const& scene) = 0;
};

struct EventRecord
{
    std::string sessionId;
    std::string eventType;
    std::string actor;
    nlohmann::json context = nlohmann::json::object();
};

// Optional event log / database. Fire-and-forget.
class EventSink
{
public:
    virtual ~EventSink() = default;
    virtual void SaveEvent(EventRecord const& record) = 0;
};

// Sends to the sink when one is attached; sink failures are logged under
// `category` and dropped.
void EmitEvent(EventSink* sink, EventRecord const& record, char const* category);

// Everything the director talks to. Any member may be null.
struct DirectorCollaborators
{
    std::shared_ptr<BranchHandler> branchHandler;
    std::shared_ptr<SummaryProvider> summaryProvider;
    std::shared_ptr<DialogueGenerator> dialogueGenerator;
    std::shared_ptr<EventSink> eventSink;
};
