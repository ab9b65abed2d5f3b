#pragma once

#include <string>
#include "config.h"
#include "submit_script.h"
#include "task.h"

enum class ChainStage
{
    Charge,
    DOS,
    WorkFunc
};

// charge, dos or wf; throws UnsupportedStageError
ChainStage ParseChainStage(const std::string &name);

// Replaces the terminal finish of an optimisation script with the follow-up stage.
// previous_check is the completion fragment of the stage being extended.
void AppendStage(SubmitScript &script, ChainStage stage, const std::string &previous_check);

// Opt task in the working directory whose script goes on to a dependent stage
class SequentialTaskChainer
{
public:
    SequentialTaskChainer(const Config &config, const TaskFlags &flags) : config_(config), flags_(flags) {}

    void Generate(const std::string &stage_name);

private:
    Config config_;
    TaskFlags flags_;
};
