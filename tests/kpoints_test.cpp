// Tests for kpoints.h -- automatic, gamma and line-mode meshes.

#include "kpoints.h"
#include "vaspkit.h"

#include <gtest/gtest.h>

#include "errors.h"
#include "test_helpers.h"

namespace
{

using testing_helpers::TempDir;
using testing_helpers::WriteText;

TEST(KMesh, AutomaticGridFromLatticeLengths)
{
    Eigen::Matrix3d lattice = Eigen::Matrix3d::Zero();
    lattice(0, 0) = 4.0;
    lattice(1, 1) = 10.0;
    lattice(2, 2) = 40.0;

    KMesh mesh = KMesh::Automatic(lattice);
    EXPECT_EQ(mesh.mode(), KMesh::Mode::Automatic);
    EXPECT_EQ(mesh.grid()[0], 8);
    EXPECT_EQ(mesh.grid()[1], 3);
    EXPECT_EQ(mesh.grid()[2], 1);
    EXPECT_EQ(mesh.Render(), "AutoGenerated\n0\nGamma\n8 3 1\n0 0 0\n");
}

TEST(KMesh, GammaOnlyIsOneOneOne)
{
    KMesh mesh = KMesh::GammaOnly();
    EXPECT_EQ(mesh.mode(), KMesh::Mode::Gamma);
    EXPECT_EQ(mesh.Render(), "AutoGenerated\n0\nGamma\n1 1 1\n0 0 0\n");
}

TEST(KMesh, LineModeWritesLabelledPairs)
{
    KPathSegment segment;
    segment.start_label = "GAMMA";
    segment.end_label = "X";
    segment.end = Eigen::Vector3d(0.5, 0.0, 0.0);

    KMesh mesh = KMesh::LinePath({segment, segment}, 40);
    std::string text = mesh.Render();
    EXPECT_EQ(text.find("Line-Mode KPOINTS\n40\nLine-mode\nReciprocal\n"), 0u);
    EXPECT_NE(text.find("  0.50000000  0.00000000  0.00000000   ! X\n"), std::string::npos);
    EXPECT_NE(text.find("! X\n\n"), std::string::npos);
}

TEST(KMesh, EmptyPathIsAnError)
{
    EXPECT_THROW(KMesh::LinePath({}, 20), FormatError);
}

TEST(ReadKPath, PairsPointsIntoSegments)
{
    TempDir dir;
    WriteText(dir.path() / "KPATH.in",
              "K-Path Generated by VASPKIT.\n   20\nLine-Mode\nReciprocal\n"
              "   0.0000000000   0.0000000000   0.0000000000     GAMMA\n"
              "   0.5000000000   0.0000000000   0.5000000000     X\n"
              "\n"
              "   0.5000000000   0.0000000000   0.5000000000     X\n"
              "   0.5000000000   0.2500000000   0.7500000000     W\n");

    std::vector<KPathSegment> segments = ReadKPath(dir.path() / "KPATH.in");
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].start_label, "GAMMA");
    EXPECT_EQ(segments[1].end_label, "W");
    EXPECT_DOUBLE_EQ(segments[1].end[2], 0.75);
}

TEST(ReadKPath, OddPointCountIsAnError)
{
    TempDir dir;
    WriteText(dir.path() / "KPATH.in", "c\n20\nLine\nRec\n0 0 0 G\n");

    EXPECT_THROW(ReadKPath(dir.path() / "KPATH.in"), FormatError);
}

TEST(VaspkitManager, ExitedProcessIsAnErrorNotASignal)
{
    TempDir dir;
    VaspkitManager vaspkit("true");
    vaspkit.startVaspkit(dir.path(), "test");

    // larger than a pipe buffer, so the write fails once the shell is gone
    EXPECT_THROW(vaspkit.sendInputToVaspkit(std::string(1 << 18, '\n')), std::runtime_error);
}

TEST(VaspkitKPathProvider, MissingVaspkitThrows)
{
    TempDir dir;
    VaspkitKPathProvider provider("vaspflow-no-such-vaspkit");
    EXPECT_THROW(provider.FindPath(dir.path()), std::runtime_error);
}

} // namespace
