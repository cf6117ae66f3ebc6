#include "ollama-gm-director.h"
#include "Ai/OllamaClient.h"
#include "Util/DirectorLog.h"

#include <utility>

namespace
{
DirectorCollaborators WithDefaultProviders(DirectorCollaborators collaborators, DirectorConfig const& config)
{
    if (!collaborators.summaryProvider && config.ollama.enable)
    {
        collaborators.summaryProvider = std::make_shared<OllamaSummaryProvider>(config.ollama);
        DIRECTOR_LOG_INFO("director.ollama", "[Ollama] Summaries via {} ({})", config.ollama.url, config.ollama.model);
    }
    return collaborators;
}
}

GameMasterDirector::GameMasterDirector(DirectorConfig config,
                                       DirectorCollaborators collaborators,
                                       std::shared_ptr<Clock> clock)
    : config_(std::move(config)),
      collaborators_(WithDefaultProviders(std::move(collaborators), config_)),
      clock_(std::move(clock)),
      engine_(config_.decision, collaborators_.branchHandler, collaborators_.eventSink, config_.randomSeed),
      sessions_(config_, clock_, collaborators_)
{
}

std::unique_ptr<GameMasterDirector> GameMasterDirector::FromConfigFile(std::string const& path,
                                                                       DirectorCollaborators collaborators)
{
    DirectorConfig config = LoadDirectorConfig(path);
    InitDirectorLogging(config.log);
    return std::make_unique<GameMasterDirector>(std::move(config), std::move(collaborators));
}

DecisionResult GameMasterDirector::HandleInput(DecisionContext const& context)
{
    // Invalid contexts never open a session.
    if (context.MissingRequiredField())
        return engine_.Decide(context);

    return sessions_.GetOrCreate(context.sessionId)->HandleTurn(engine_, context);
}

std::optional<AmbientInjection> GameMasterDirector::CheckAmbient(SceneContext const& scene)
{
    std::shared_ptr<PacingIntegration> session = sessions_.Find(scene.sessionId);
    if (!session)
        return std::nullopt;
    return session->CheckAmbient(scene);
}

std::optional<NpcInitiative> GameMasterDirector::CheckNpcInitiative(SceneContext const& scene)
{
    std::shared_ptr<PacingIntegration> session = sessions_.Find(scene.sessionId);
    if (!session)
        return std::nullopt;
    return session->CheckNpcInitiative(scene);
}

std::optional<SummaryOutcome> GameMasterDirector::CheckSummary(std::string const& sessionId)
{
    std::shared_ptr<PacingIntegration> session = sessions_.Find(sessionId);
    if (!session)
        return std::nullopt;
    return session->CheckSummary();
}

void GameMasterDirector::RecordWorldReaction(std::string const& sessionId, WorldReaction const& reaction)
{
    sessions_.GetOrCreate(sessionId)->RecordWorldReaction(reaction);
}

StoryContext GameMasterDirector::GetStoryContext(std::string const& sessionId) const
{
    std::shared_ptr<PacingIntegration> session = sessions_.Find(sessionId);
    if (!session)
        return StoryContext();
    return session->GetStoryContext();
}

bool GameMasterDirector::EndSession(std::string const& sessionId)
{
    return sessions_.Drop(sessionId);
}

size_t GameMasterDirector::ReapStaleSessions()
{
    return sessions_.DropStale();
}

nlohmann::json GameMasterDirector::GetStatistics() const
{
    nlohmann::json sessions = nlohmann::json::object();
    for (auto const& sessionId : sessions_.SessionIds())
    {
        if (std::shared_ptr<PacingIntegration> session = sessions_.Find(sessionId))
            sessions[sessionId] = session->GetStatistics();
    }
    return {
        {"decisions", engine_.GetStats().ToJson()},
        {"live_sessions", sessions_.Size()},
        {"sessions", sessions}};
}
