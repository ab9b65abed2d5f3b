#include "sequencer.h"
#include "errors.h"
#include "logger.h"
#include "vasp.h"
#include "vasp_tool.h"

#include <iostream>

namespace
{

std::string StagePath(const char *dir, const char *file)
{
    return std::string(dir) + "/" + file;
}

// start the next stage from the relaxed structure of the current directory
void CopyRelaxedInputs(SubmitScript &script, const char *dir)
{
    script.AddCommand(std::string("mkdir -p ") + dir)
        .AddCommand(std::string("cp ") + INCAR + " " + KPOINTS + " " + POTCAR + " " + dir + "/")
        .AddCommand(std::string("cp ") + CONTCAR + " " + StagePath(dir, POSCAR));
}

void AppendChargeBlock(SubmitScript &script, const std::string &previous_check)
{
    script.AddComment("charge density from the optimised structure")
        .AddFragment(previous_check);
    CopyRelaxedInputs(script, CHG_DIR);
    script.EditIncar(StagePath(CHG_DIR, INCAR), IncarPatch()
                                                    .Set("NSW", 0)
                                                    .Set("IBRION", -1)
                                                    .Set("LCHARG", true)
                                                    .Set("LAECHG", true))
        .ChangeDir(CHG_DIR)
        .AddFragment(FRAGMENT_RUN);
}

void AppendDOSBlock(SubmitScript &script, const std::string &previous_check)
{
    AppendChargeBlock(script, previous_check);
    // 上一步是自洽计算, 按 charge 的规则检查
    script.AddComment("density of states from the converged charge density")
        .AddFragment(FRAGMENT_CHECK_SCF)
        .ChangeDir("..")
        .AddCommand(std::string("mkdir -p ") + DOS_DIR)
        .AddCommand(std::string("cp ") + StagePath(CHG_DIR, INCAR) + " " + StagePath(CHG_DIR, KPOINTS) + " " +
                    StagePath(CHG_DIR, POTCAR) + " " + StagePath(CHG_DIR, POSCAR) + " " + StagePath(CHG_DIR, CHGCAR) + " " +
                    DOS_DIR + "/")
        .EditIncar(StagePath(DOS_DIR, INCAR), IncarPatch()
                                                  .Set("ISTART", 1)
                                                  .Set("ICHARG", 11)
                                                  .Set("NSW", 1)
                                                  .Set("IBRION", -1)
                                                  .Set("LCHARG", false)
                                                  .Set("LORBIT", 12)
                                                  .Set("NEDOS", 2000)
                                                  .Delete("LAECHG"))
        .ChangeDir(DOS_DIR)
        .AddFragment(FRAGMENT_RUN);
}

void AppendWorkFuncBlock(SubmitScript &script, const std::string &previous_check)
{
    script.AddComment("work function from the optimised structure")
        .AddFragment(previous_check);
    CopyRelaxedInputs(script, WF_DIR);
    script.EditIncar(StagePath(WF_DIR, INCAR), IncarPatch()
                                                   .Set("NSW", 1)
                                                   .Set("IBRION", -1)
                                                   .Set("LVHAR", true)
                                                   .Set("LCHARG", false))
        .ChangeDir(WF_DIR)
        .AddFragment(FRAGMENT_RUN);
}

} // namespace

ChainStage ParseChainStage(const std::string &name)
{
    if (name == "charge" || name == "chg")
    {
        return ChainStage::Charge;
    }
    if (name == "dos")
    {
        return ChainStage::DOS;
    }
    if (name == "wf")
    {
        return ChainStage::WorkFunc;
    }
    throw UnsupportedStageError("Unsupported sequence stage: " + name + " (charge, dos or wf)");
}

void AppendStage(SubmitScript &script, ChainStage stage, const std::string &previous_check)
{
    script.RemoveTerminal();
    switch (stage)
    {
    case ChainStage::Charge:
        AppendChargeBlock(script, previous_check);
        break;
    case ChainStage::DOS:
        AppendDOSBlock(script, previous_check);
        break;
    case ChainStage::WorkFunc:
        AppendWorkFuncBlock(script, previous_check);
        break;
    }
    script.AddFragment(FRAGMENT_FINISH);
}

void SequentialTaskChainer::Generate(const std::string &stage_name)
{
    ChainStage stage = ParseChainStage(stage_name);

    VaspTask task(config_, TaskType::Opt, flags_);
    task.Prepare();
    AppendStage(task.script(), stage, CompletionCheck(TaskType::Opt, flags_));
    task.WriteSubmitScript();
    task.PrintSummary(std::cout);
    LOG_INFO("Sequence opt -> " << stage_name << " written to " << SUBMIT_SCRIPT);
}
