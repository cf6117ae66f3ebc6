#pragma once

#include "Ai/Collaborators.h"
#include "Config/DirectorConfig.h"
#include "Decision/DecisionEngine.h"
#include "Pacing/PacingIntegration.h"
#include "Pacing/SessionRegistry.h"
#include "Util/Clock.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

// Host-facing entry point: one shared decision engine plus per-session pacing.
// Every call returns a well-formed result; collaborator failures degrade.
class GameMasterDirector
{
public:
    GameMasterDirector(DirectorConfig config,
                       DirectorCollaborators collaborators,
                       std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());

    // Load config, set up logging and attach the Ollama summarizer when enabled
    // and the host did not supply one. Throws ConfigError.
    static std::unique_ptr<GameMasterDirector> FromConfigFile(std::string const& path, DirectorCollaborators collaborators);

    DecisionResult HandleInput(DecisionContext const& context);

    // Polls. Unknown sessions get nothing back.
    std::optional<AmbientInjection> CheckAmbient(SceneContext const& scene);
    std::optional<NpcInitiative> CheckNpcInitiative(SceneContext const& scene);
    std::optional<SummaryOutcome> CheckSummary(std::string const& sessionId);

    void RecordWorldReaction(std::string const& sessionId, WorldReaction const& reaction);
    StoryContext GetStoryContext(std::string const& sessionId) const;

    bool EndSession(std::string const& sessionId);
    size_t ReapStaleSessions();

    nlohmann::json GetStatistics() const;

    DecisionEngine& Engine() { return engine_; }
    SessionRegistry& Sessions() { return sessions_; }
    DirectorConfig const& Config() const { return config_; }

private:
    DirectorConfig config_;
    DirectorCollaborators collaborators_;
    std::shared_ptr<Clock> clock_;
    DecisionEngine engine_;
    SessionRegistry sessions_;
};
