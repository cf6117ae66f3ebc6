#pragma once

#include "Config/DirectorConfig.h"
#include "Decision/DecisionTypes.h"
#include "Util/RandomSource.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

struct SkillCheckResult
{
    bool success = false;
    // d20, reported for narration only; success comes from the chance roll.
    int32_t roll = 1;
    int32_t difficulty = 12;
    double chance = 0.0;
    std::optional<std::string> failureReason;

    nlohmann::json ToJson() const;
};

// Chance after world-state modifiers, clamped to [0, 1].
double SkillCheckChance(DecisionSettings const& settings, WorldState const& world);

SkillCheckResult RollSkillCheck(DecisionSettings const& settings, WorldState const& world, RandomSource& rng);
