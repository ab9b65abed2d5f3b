// Tests for submit_script.h -- fragment sequence, structured edits, rendering.

#include "submit_script.h"

#include <gtest/gtest.h>

#include "errors.h"
#include "test_helpers.h"

namespace
{

SchedulerTemplate Scheduler()
{
    SchedulerTemplate scheduler;
    scheduler.Add("header", "#!/bin/bash\n");
    scheduler.Add("run", "mpirun vasp_std");
    scheduler.Add("finish", "echo done\n");
    return scheduler;
}

TEST(SchedulerTemplate, LoadsFragmentsFromYaml)
{
    testing_helpers::TempDir dir;
    testing_helpers::WriteText(dir.path() / "submit.yaml", testing_helpers::DefaultSubmit());

    SchedulerTemplate scheduler = SchedulerTemplate::Load(dir.path() / "submit.yaml");
    EXPECT_TRUE(scheduler.Has("check_opt"));
    EXPECT_EQ(scheduler.Body("finish"), "echo done");
    EXPECT_THROW(scheduler.Body("cleanup"), FormatError);
}

TEST(SubmitScript, RendersFragmentsInOrder)
{
    SubmitScript script;
    script.AddFragment("header").AddFragment("run").AddFragment("finish");

    EXPECT_EQ(script.Render(Scheduler()), "#!/bin/bash\nmpirun vasp_std\necho done\n");
}

TEST(SubmitScript, RemoveTerminalDropsOnlyTheFinish)
{
    SubmitScript script;
    script.AddFragment("header").AddFragment("run").AddFragment("finish").AddCommand("sync");

    script.RemoveTerminal();
    EXPECT_EQ(script.CountFragment("finish"), 0u);
    EXPECT_EQ(script.Fragments().back(), "run");
    EXPECT_EQ(script.items().back().text, "sync");
}

TEST(SubmitScript, RemoveTerminalWithoutFinishThrows)
{
    SubmitScript script;
    script.AddFragment("header").AddFragment("run");

    EXPECT_THROW(script.RemoveTerminal(), std::runtime_error);
}

TEST(SubmitScript, EditsRenderAsDeleteThenAppend)
{
    SubmitScript script;
    script.EditIncar("chg_calc/INCAR", IncarPatch().Set("nsw", 0).Delete("LAECHG"));

    EXPECT_EQ(script.Render(Scheduler()),
              "sed -i '/^\\s*NSW\\s*=/d' 'chg_calc/INCAR'\n"
              "echo \"NSW = 0\" >> 'chg_calc/INCAR'\n"
              "sed -i '/^\\s*LAECHG\\s*=/d' 'chg_calc/INCAR'\n");
}

TEST(SubmitScript, FileContentIsAHereDocument)
{
    SubmitScript script;
    script.AddFile("KPOINTS", "AutoGenerated\n0\n").ChangeDir("dos_calc");

    EXPECT_EQ(script.Render(Scheduler()), "cat > 'KPOINTS' << 'EOF'\nAutoGenerated\n0\nEOF\ncd 'dos_calc'\n");
}

TEST(IncarPatch, ApplyToMatchesRenderedEdits)
{
    Incar incar = Incar::Parse("NSW = 200\nLAECHG = .TRUE.\nENCUT = 450\n");
    IncarPatch().Set("NSW", 1).Set("LCHARG", false).Delete("LAECHG").ApplyTo(incar);

    EXPECT_EQ(incar.Render(), "ENCUT = 450\nNSW = 1\nLCHARG = .FALSE.\n");
}

} // namespace
