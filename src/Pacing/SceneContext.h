#pragma once

#include "Decision/DecisionTypes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct NpcProfile
{
    std::string npcId;
    // Display name; falls back to a title-cased id when empty.
    std::string name;
    // friendly, helpful, curious, shy, suspicious, professional, gruff, wise, ...
    std::string personality = "professional";
    // Per-NPC idle threshold; the configured default applies when unset.
    std::optional<uint32_t> idleThresholdSeconds;

    std::string DisplayName() const;
};

// What the host knows about the player's surroundings at poll time.
struct SceneContext
{
    std::string sessionId;
    std::string playerId;
    WorldState worldState;
    PlayerContext playerContext;
    // Host order is significant: the first eligible NPC wins an initiative check.
    std::vector<NpcProfile> presentNpcs;

    NpcProfile const* FindNpc(std::string const& npcId) const;
};
