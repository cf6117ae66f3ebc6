#pragma once

#include "Ai/Collaborators.h"
#include "Config/DirectorConfig.h"
#include "Decision/DecisionTypes.h"
#include "Util/RandomSource.h"

#include <memory>
#include <string>

// One executor per ladder rule. `argument` carries the rule's subject
// (opportunity id, branch action, verb); rules without one pass an empty string.
// Executors may throw when a collaborator does; the engine catches at its boundary.
class ActionExecutor
{
public:
    virtual ~ActionExecutor() = default;

    virtual ActionType Type() const = 0;
    virtual ActionResult Execute(DecisionContext const& context, std::string const& argument, RandomSource& rng) = 0;
};

class OpportunityInitiationExecutor : public ActionExecutor
{
public:
    OpportunityInitiationExecutor(std::shared_ptr<BranchHandler> branchHandler, std::shared_ptr<EventSink> eventSink);

    ActionType Type() const override { return ActionType::OpportunityInitiation; }
    ActionResult Execute(DecisionContext const& context, std::string const& opportunityId, RandomSource& rng) override;

private:
    std::shared_ptr<BranchHandler> branchHandler_;
    std::shared_ptr<EventSink> eventSink_;
};

// Runs the skill check for an action the engine already validated against the stage.
class BranchActionExecutor : public ActionExecutor
{
public:
    BranchActionExecutor(DecisionSettings settings, std::shared_ptr<EventSink> eventSink);

    ActionType Type() const override { return ActionType::BranchAction; }
    ActionResult Execute(DecisionContext const& context, std::string const& action, RandomSource& rng) override;

private:
    DecisionSettings settings_;
    std::shared_ptr<EventSink> eventSink_;
};

// Closed verb table: look, take, go, attack, use, talk.
class ParsedCommandExecutor : public ActionExecutor
{
public:
    explicit ParsedCommandExecutor(std::shared_ptr<EventSink> eventSink);

    ActionType Type() const override { return ActionType::ParsedCommand; }
    ActionResult Execute(DecisionContext const& context, std::string const& verb, RandomSource& rng) override;

    // {success, description} for a verb; unknown verbs fail with "Action not recognized.".
    static nlohmann::json DescribeVerb(std::string const& verb);

private:
    std::shared_ptr<EventSink> eventSink_;
};

class GeneralInterpretationExecutor : public ActionExecutor
{
public:
    ActionType Type() const override { return ActionType::GeneralInterpretation; }
    ActionResult Execute(DecisionContext const& context, std::string const& argument, RandomSource& rng) override;
};

class FallbackResponseExecutor : public ActionExecutor
{
public:
    ActionType Type() const override { return ActionType::FallbackResponse; }
    ActionResult Execute(DecisionContext const& context, std::string const& argument, RandomSource& rng) override;
};
