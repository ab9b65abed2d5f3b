// Tests for incar.h -- typed INCAR parsing, edits and serialisation.

#include "incar.h"

#include <gtest/gtest.h>

#include "errors.h"
#include "test_helpers.h"

namespace
{

TEST(IncarParse, InfersTypesPerToken)
{
    Incar incar = Incar::Parse("ENCUT = 450\nEDIFF = 1E-05\nLWAVE = .FALSE.\nALGO = Fast\nSIGMA = 0.05\n");

    EXPECT_EQ(incar.Get<int>("ENCUT", 0), 450);
    EXPECT_DOUBLE_EQ(incar.Get<double>("EDIFF", 0.0), 1e-5);
    EXPECT_FALSE(incar.Get<bool>("LWAVE", true));
    EXPECT_EQ(incar.Get<std::string>("ALGO", ""), "Fast");
    EXPECT_DOUBLE_EQ(incar.Get<double>("SIGMA", 0.0), 0.05);
}

TEST(IncarParse, CommentsAndSemicolons)
{
    Incar incar = Incar::Parse("# header\nISTART = 0; ICHARG = 2 ! restart\n\nNSW = 10 # steps\n");

    ASSERT_EQ(incar.Keys().size(), 3u);
    EXPECT_EQ(incar.Keys()[0], "ISTART");
    EXPECT_EQ(incar.Keys()[1], "ICHARG");
    EXPECT_EQ(incar.Get<int>("NSW", 0), 10);
}

TEST(IncarParse, MultipleTokensFormAList)
{
    Incar incar = Incar::Parse("LDAUL = 2 -1\nMAGMOM = 4.0 0.0 0.0\n");

    IncarList ldaul = incar.GetList("LDAUL");
    ASSERT_EQ(ldaul.size(), 2u);
    EXPECT_EQ(boost::get<int>(ldaul[0]), 2);
    EXPECT_EQ(boost::get<int>(ldaul[1]), -1);
    EXPECT_EQ(incar.GetList("MAGMOM").size(), 3u);
}

TEST(IncarParse, LineWithoutAssignmentIsAnError)
{
    EXPECT_THROW(Incar::Parse("ENCUT 450\n"), FormatError);
}

TEST(Incar, KeysAreCaseInsensitive)
{
    Incar incar;
    incar.Set("DdR", 0.005);

    EXPECT_TRUE(incar.Has("DDR"));
    EXPECT_TRUE(incar.Has("ddr"));
    EXPECT_EQ(incar.Keys().front(), "DDR");
}

TEST(Incar, DeleteAbsentKeyIsNoOp)
{
    Incar incar = Incar::Parse("ENCUT = 450\n");

    EXPECT_NO_THROW(incar.Delete("LAECHG"));
    EXPECT_NO_THROW(incar.Delete("LAECHG"));
    EXPECT_EQ(incar.Keys().size(), 1u);
}

TEST(Incar, LaterSetWinsAndKeepsPosition)
{
    Incar incar = Incar::Parse("IBRION = 2\nNSW = 200\n");
    incar.Set("IBRION", -1);
    incar.Set("LVHAR", true);

    EXPECT_EQ(incar.Render(), "IBRION = -1\nNSW = 200\nLVHAR = .TRUE.\n");
}

TEST(Incar, DeleteThenSetAppends)
{
    Incar incar = Incar::Parse("IBRION = 2\nNSW = 200\n");
    incar.Delete("IBRION");
    incar.Set("IBRION", 1);

    EXPECT_EQ(incar.Keys().back(), "IBRION");
}

TEST(Incar, SetFollowsTheTemplateType)
{
    Incar incar = Incar::Parse("ENCUT = 450.0\nNSW = 200\nSMASS = 1\nLDAUU = 5.3 0.0\nALGO = Fast\n");
    incar.Set("ENCUT", 300);
    incar.Set("NSW", 1.0);
    incar.Set("SMASS", 2.5);
    incar.Set("LDAUU", IncarList{IncarScalar(4), IncarScalar(0)});
    incar.Set("NEDOS", 2000);

    EXPECT_EQ(incar.Render(), "ENCUT = 300.0\nNSW = 1\nSMASS = 2.5\nLDAUU = 4.0 0.0\nALGO = Fast\nNEDOS = 2000\n");
}

TEST(Incar, GetWithWrongTypeThrows)
{
    Incar incar = Incar::Parse("ALGO = Fast\n");

    EXPECT_THROW(incar.Get<int>("ALGO", 0), FormatError);
    EXPECT_EQ(incar.Get<int>("MISSING", 7), 7);
}

TEST(IncarFormat, FloatsAlwaysCarryADecimalPoint)
{
    EXPECT_EQ(Incar::FormatScalar(IncarScalar(2.0)), "2.0");
    EXPECT_EQ(Incar::FormatScalar(IncarScalar(0.015)), "0.015");
    EXPECT_EQ(Incar::FormatScalar(IncarScalar(-5.0)), "-5.0");
    EXPECT_EQ(Incar::FormatScalar(IncarScalar(false)), ".FALSE.");
}

TEST(Incar, WriteAndLoadRoundTrip)
{
    testing_helpers::TempDir dir;
    Incar incar = Incar::Parse("ENCUT = 450\nLDAUU = 5.3 0.0\n");
    incar.Write(dir.path() / "INCAR");

    Incar loaded = Incar::Load(dir.path() / "INCAR");
    EXPECT_EQ(loaded.Render(), incar.Render());
}

} // namespace
