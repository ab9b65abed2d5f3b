#pragma once

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "config.h"
#include "kpoints.h"
#include "path_solver.h"

namespace fs = boost::filesystem;

namespace testing_helpers
{

// Scratch directory removed with the fixture
class TempDir
{
public:
    TempDir() : path_(fs::temp_directory_path() / fs::unique_path("vaspflow-%%%%-%%%%-%%%%"))
    {
        fs::create_directories(path_);
    }
    ~TempDir()
    {
        boost::system::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const fs::path &path() const { return path_; }

private:
    fs::path path_;
};

inline void WriteText(const fs::path &path, const std::string &text)
{
    if (path.has_parent_path())
    {
        fs::create_directories(path.parent_path());
    }
    std::ofstream outfile(path.string());
    outfile << text;
}

inline std::string ReadText(const fs::path &path)
{
    std::ifstream infile(path.string());
    std::stringstream buffer;
    buffer << infile.rdbuf();
    return buffer.str();
}

struct TestAtom
{
    std::string element;
    double x, y, z;
};

// VASP5 POSCAR in a cubic cell, atoms already grouped by element
inline std::string CubicPoscar(double a, const std::vector<TestAtom> &atoms)
{
    std::vector<std::string> elements;
    std::vector<int> counts;
    for (const auto &atom : atoms)
    {
        if (elements.empty() || elements.back() != atom.element)
        {
            elements.push_back(atom.element);
            counts.push_back(0);
        }
        counts.back()++;
    }

    std::ostringstream oss;
    oss << "test\n1.0\n"
        << a << " 0.0 0.0\n0.0 " << a << " 0.0\n0.0 0.0 " << a << "\n";
    for (const auto &element : elements)
    {
        oss << " " << element;
    }
    oss << "\n";
    for (int count : counts)
    {
        oss << " " << count;
    }
    oss << "\nDirect\n";
    for (const auto &atom : atoms)
    {
        oss << atom.x << " " << atom.y << " " << atom.z << "\n";
    }
    return oss.str();
}

// Materials Studio document with a 10 A cubic cell
inline std::string CubicXsd(const std::vector<std::string> &atom_lines)
{
    std::ostringstream oss;
    oss << "<?xml version=\"1.0\" encoding=\"latin1\"?>\n"
        << "<XSD Version=\"20.1\">\n"
        << " <AtomisticTreeRoot ID=\"1\">\n"
        << "  <SymmetrySystem ID=\"2\" Mapping=\"3\">\n"
        << "   <MappingSet ID=\"8\">\n"
        << "    <MappingFamily ID=\"9\">\n"
        << "     <IdentityMapping ID=\"10\" Element=\"1,0,0,0,1,0,0,0,1\">\n";
    for (const auto &line : atom_lines)
    {
        oss << "      " << line << "\n";
    }
    oss << "      <SpaceGroup ID=\"90\" Name=\"P1\" AVector=\"10,0,0\" BVector=\"0,10,0\" CVector=\"0,0,10\"/>\n"
        << "     </IdentityMapping>\n"
        << "    </MappingFamily>\n"
        << "   </MappingSet>\n"
        << "  </SymmetrySystem>\n"
        << " </AtomisticTreeRoot>\n"
        << "</XSD>\n";
    return oss.str();
}

inline void WritePotential(const fs::path &pot_dir, const std::string &element, double zval)
{
    std::ostringstream oss;
    oss << "  PAW_PBE " << element << " 06Sep2000\n"
        << "  " << zval << "\n"
        << " parameters from PSCTR are:\n"
        << "   POMASS =   10.000; ZVAL   =    " << zval << "    mass and valenz\n"
        << " End of Dataset\n";
    WriteText(pot_dir / "PAW_PBE" / element / "POTCAR", oss.str());
}

inline const char *DefaultIncar()
{
    return "SYSTEM = test\n"
           "ENCUT = 450\n"
           "PREC = Normal\n"
           "IBRION = 2\n"
           "NSW = 200\n"
           "LCHARG = .TRUE.\n"
           "LDAU = .TRUE.\n"
           "LDAUTYPE = 2\n";
}

inline const char *DefaultSubmit()
{
    return "header: \"#!/bin/bash\"\n"
           "environment: \"module load vasp\"\n"
           "run: \"mpirun vasp_std > vasp.out\"\n"
           "check_opt: \"grep -q 'reached required accuracy' OUTCAR || exit 1\"\n"
           "check_scf: \"grep -q 'EDIFF is reached' OUTCAR || exit 1\"\n"
           "analysis: \"bader CHGCAR\"\n"
           "finish: \"echo done\"\n";
}

// Config pointing at templates and potentials written under root/defaults
inline Config MakeConfig(const fs::path &work_dir, const fs::path &root)
{
    fs::path defaults = root / "defaults";
    WriteText(defaults / "INCAR", DefaultIncar());
    WriteText(defaults / "UValue.yaml", "Element Fe: {orbital: 2, U: 5.3, J: 0.0}\nElement Ce: {orbital: 3, U: 5.0, J: 0.0}\n");
    WriteText(defaults / "submit.yaml", DefaultSubmit());
    WritePotential(defaults / "potentials", "Fe", 8.0);
    WritePotential(defaults / "potentials", "O", 6.0);
    WritePotential(defaults / "potentials", "H", 1.0);
    WritePotential(defaults / "potentials", "Ce", 12.0);

    Config config;
    config.work_dir = work_dir;
    config.search_path = {work_dir};
    config.incar_template = defaults / "INCAR";
    config.uvalue_file = defaults / "UValue.yaml";
    config.submit_template = defaults / "submit.yaml";
    config.pot_dir = defaults / "potentials";
    config.potential = "PAW_PBE";
    config.overlap_distance = 0.5;
    config.vaspkit_command = "false";
    return config;
}

class FixedKPathProvider : public KPathProvider
{
public:
    std::vector<KPathSegment> FindPath(const fs::path &) override
    {
        KPathSegment segment;
        segment.start_label = "GAMMA";
        segment.end_label = "X";
        segment.end = Eigen::Vector3d(0.5, 0.0, 0.0);
        return {segment};
    }
};

// every image but the last is a copy of ini
class CopyingPathSolver : public PathSolver
{
public:
    void Solve(const fs::path &ini_poscar, const fs::path &fni_poscar, int images, const fs::path &out_dir) override
    {
        ++calls;
        for (int k = 0; k <= images + 1; ++k)
        {
            char name[8];
            std::snprintf(name, sizeof(name), "%02d", k);
            fs::create_directories(out_dir / name);
            fs::copy_file(k == images + 1 ? fni_poscar : ini_poscar, out_dir / name / "POSCAR",
                          fs::copy_options::overwrite_existing);
        }
    }

    int calls = 0;
};

} // namespace testing_helpers
