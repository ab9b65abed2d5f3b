// Tests for structure.h and structure_io.h -- geometry, POSCAR/XSD/XDATCAR/ARC IO.

#include "structure.h"
#include "structure_io.h"

#include <gtest/gtest.h>

#include "errors.h"
#include "test_helpers.h"

namespace
{

using testing_helpers::CubicPoscar;
using testing_helpers::CubicXsd;
using testing_helpers::ReadText;
using testing_helpers::TempDir;
using testing_helpers::WriteText;

Atom MakeAtom(const std::string &element, double x, double y, double z)
{
    Atom atom;
    atom.element = element;
    atom.frac = Eigen::Vector3d(x, y, z);
    return atom;
}

Structure CubicCell(double a, const std::vector<Atom> &atoms)
{
    return Structure(Eigen::Matrix3d::Identity() * a, atoms);
}

// ---------------------------------------------------------------------------
// Structure
// ---------------------------------------------------------------------------

TEST(Structure, ElementsInOrderOfFirstAppearance)
{
    Structure s = CubicCell(10.0, {MakeAtom("Fe", 0, 0, 0), MakeAtom("Fe", 0.5, 0, 0), MakeAtom("O", 0, 0.5, 0)});

    ASSERT_EQ(s.Elements().size(), 2u);
    EXPECT_EQ(s.Elements()[0], "Fe");
    EXPECT_EQ(s.ElementCounts()[0], 2);
    EXPECT_EQ(s.ElementCounts()[1], 1);
}

TEST(Structure, EqualityIgnoresCoordinates)
{
    Structure a = CubicCell(10.0, {MakeAtom("Fe", 0, 0, 0), MakeAtom("O", 0.1, 0, 0)});
    Structure b = CubicCell(10.0, {MakeAtom("Fe", 0.3, 0.3, 0), MakeAtom("O", 0.7, 0, 0)});
    Structure swapped = CubicCell(10.0, {MakeAtom("O", 0, 0, 0), MakeAtom("Fe", 0.1, 0, 0)});

    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a != swapped);
}

TEST(Structure, DirectAndMinimumImageDistance)
{
    Structure s = CubicCell(10.0, {MakeAtom("H", 0.05, 0, 0), MakeAtom("H", 0.95, 0, 0)});

    EXPECT_NEAR(s.Distance(0, 1), 9.0, 1e-9);
    EXPECT_NEAR(s.MinimumImageDistance(0, 1), 1.0, 1e-9);
}

TEST(Structure, FindOverlapsAcrossTheBoundary)
{
    Structure s = CubicCell(10.0, {MakeAtom("H", 0.01, 0, 0), MakeAtom("H", 0.99, 0, 0), MakeAtom("O", 0.5, 0.5, 0.5)});

    std::vector<OverlapPair> overlaps = s.FindOverlaps(0.5);
    ASSERT_EQ(overlaps.size(), 1u);
    EXPECT_EQ(overlaps[0].first, 0u);
    EXPECT_EQ(overlaps[0].second, 1u);
    EXPECT_NEAR(overlaps[0].distance, 0.2, 1e-9);
}

TEST(Structure, WithCartCoordsRederivesFractions)
{
    Structure s = CubicCell(10.0, {MakeAtom("H", 0, 0, 0)});
    Structure moved = s.WithCartCoords({Eigen::Vector3d(2.5, 5.0, 0.0)});

    EXPECT_NEAR(moved.atoms()[0].frac[0], 0.25, 1e-12);
    EXPECT_NEAR(moved.atoms()[0].frac[1], 0.5, 1e-12);
}

TEST(Structure, GroupByElementIsStable)
{
    std::vector<Atom> grouped = GroupByElement({MakeAtom("Fe", 0, 0, 0), MakeAtom("O", 0.1, 0, 0), MakeAtom("Fe", 0.2, 0, 0)});

    EXPECT_EQ(grouped[0].element, "Fe");
    EXPECT_EQ(grouped[1].element, "Fe");
    EXPECT_DOUBLE_EQ(grouped[1].frac[0], 0.2);
    EXPECT_EQ(grouped[2].element, "O");
}

// ---------------------------------------------------------------------------
// POSCAR
// ---------------------------------------------------------------------------

TEST(Poscar, ReadDirectWithoutSelectiveDynamics)
{
    TempDir dir;
    WriteText(dir.path() / "POSCAR", CubicPoscar(10.0, {{"Fe", 0, 0, 0}, {"O", 0.5, 0.25, 0}}));

    Structure s = ReadPoscar(dir.path() / "POSCAR");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s.atoms()[1].element, "O");
    EXPECT_DOUBLE_EQ(s.atoms()[1].frac[1], 0.25);
    EXPECT_TRUE(s.atoms()[1].relax[0]);
    EXPECT_DOUBLE_EQ(s.lattice()(2, 2), 10.0);
}

TEST(Poscar, ReadCartesianWithFlags)
{
    TempDir dir;
    WriteText(dir.path() / "POSCAR",
              "cart\n2.0\n5 0 0\n0 5 0\n0 0 5\nH\n1\nSelective dynamics\nCartesian\n2.5 0.0 0.0 F F T\n");

    Structure s = ReadPoscar(dir.path() / "POSCAR");
    // cartesian positions are scaled like the lattice
    EXPECT_NEAR(s.atoms()[0].frac[0], 0.5, 1e-12);
    EXPECT_FALSE(s.atoms()[0].relax[0]);
    EXPECT_TRUE(s.atoms()[0].relax[2]);
}

TEST(Poscar, Vasp4LayoutIsRejected)
{
    TempDir dir;
    WriteText(dir.path() / "POSCAR", "old\n1.0\n5 0 0\n0 5 0\n0 0 5\n1\nDirect\n0 0 0\n");

    EXPECT_THROW(ReadPoscar(dir.path() / "POSCAR"), FormatError);
}

TEST(Poscar, WriteThenReadKeepsFlags)
{
    TempDir dir;
    Atom fixed = MakeAtom("O", 0.5, 0.5, 0.5);
    fixed.relax = {{false, false, false}};
    Structure s = CubicCell(10.0, {MakeAtom("Fe", 0.125, 0, 0), fixed});

    WritePoscar(s, dir.path() / "POSCAR");
    Structure loaded = ReadPoscar(dir.path() / "POSCAR");

    EXPECT_TRUE(loaded == s);
    EXPECT_DOUBLE_EQ(loaded.atoms()[0].frac[0], 0.125);
    EXPECT_FALSE(loaded.atoms()[1].relax[1]);
    EXPECT_EQ(loaded.RelaxedCount("O"), 0);
    EXPECT_NE(ReadText(dir.path() / "POSCAR").find("Selective dynamics"), std::string::npos);
}

// ---------------------------------------------------------------------------
// XSD
// ---------------------------------------------------------------------------

TEST(Xsd, ReadsAtomsGroupedWithProperties)
{
    TempDir dir;
    WriteText(dir.path() / "model.xsd",
              CubicXsd({"<Atom3d ID=\"11\" Name=\"Fe1\" XYZ=\"0,0,0\" Components=\"Fe\" FormalSpin=\"4\"/>",
                        "<Atom3d ID=\"12\" Name=\"O1\" XYZ=\"0.5,0.5,0.5\" Components=\"O\" RestrictedProperties=\"FractionalXYZ\"/>",
                        "<Atom3d ID=\"13\" Name=\"Fe2_constrain\" XYZ=\"0.25,0,0\" Components=\"Fe\"/>",
                        "<Atom3d ID=\"14\" ImageOf=\"11\" XYZ=\"1,0,0\" Components=\"Fe\"/>"}));

    Structure s = ReadXsd(dir.path() / "model.xsd");
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s.atoms()[0].element, "Fe");
    EXPECT_EQ(s.atoms()[1].element, "Fe");
    EXPECT_EQ(s.atoms()[2].element, "O");
    ASSERT_TRUE(s.atoms()[0].spin);
    EXPECT_DOUBLE_EQ(*s.atoms()[0].spin, 4.0);
    EXPECT_TRUE(s.atoms()[1].constrained);
    EXPECT_FALSE(s.atoms()[2].relax[0]);
    EXPECT_DOUBLE_EQ(s.lattice()(0, 0), 10.0);
}

TEST(Xsd, MissingSpaceGroupIsAnError)
{
    TempDir dir;
    WriteText(dir.path() / "mol.xsd", "<XSD><Atom3d XYZ=\"0,0,0\" Components=\"H\"/></XSD>");

    EXPECT_THROW(ReadXsd(dir.path() / "mol.xsd"), FormatError);
}

// ---------------------------------------------------------------------------
// XDATCAR / ARC
// ---------------------------------------------------------------------------

TEST(Xdatcar, ReadsEveryConfiguration)
{
    TempDir dir;
    WriteText(dir.path() / "XDATCAR",
              "run\n1.0\n10 0 0\n0 10 0\n0 0 10\nH O\n1 1\n"
              "Direct configuration=     1\n0 0 0\n0.5 0 0\n"
              "Direct configuration=     2\n0.1 0 0\n0.5 0 0\n");

    std::vector<Structure> frames = ReadXdatcar(dir.path() / "XDATCAR");
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_DOUBLE_EQ(frames[1].atoms()[0].frac[0], 0.1);
}

TEST(Arc, WritesOneBlockPerFrame)
{
    TempDir dir;
    Structure s = CubicCell(10.0, {MakeAtom("H", 0, 0, 0)});
    WriteArc({s, s}, dir.path() / "movie.arc");

    std::string text = ReadText(dir.path() / "movie.arc");
    EXPECT_EQ(text.find("!BIOSYM archive 3"), 0u);
    EXPECT_NE(text.find("Frame 2"), std::string::npos);
    EXPECT_NE(text.find("PBC   10.0000   10.0000   10.0000   90.0000   90.0000   90.0000 (P1)"), std::string::npos);
}

} // namespace
