#include "structure_io.h"
#include "errors.h"
#include "vasp_tool.h"

#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

namespace pt = boost::property_tree;

namespace
{

const double kDegree = std::acos(-1.0) / 180.0;

std::vector<std::string> ReadLines(const fs::path &path)
{
    std::ifstream infile(path.string());
    if (!infile.is_open())
    {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(infile, line))
    {
        lines.push_back(line);
    }
    return lines;
}

const std::string &LineAt(const std::vector<std::string> &lines, std::size_t index, const fs::path &path)
{
    if (index >= lines.size())
    {
        throw FormatError(path.string() + " ends unexpectedly at line " + std::to_string(index + 1));
    }
    return lines[index];
}

Eigen::Vector3d ParseVector(const std::vector<std::string> &tokens, const fs::path &path)
{
    if (tokens.size() < 3)
    {
        throw FormatError("Expected three numbers in " + path.string());
    }
    return Eigen::Vector3d(std::stod(tokens[0]), std::stod(tokens[1]), std::stod(tokens[2]));
}

bool IsNumber(const std::string &token)
{
    char *end = nullptr;
    std::strtod(token.c_str(), &end);
    return end != token.c_str() && *end == '\0';
}

struct PoscarHeader
{
    Eigen::Matrix3d lattice;
    std::vector<std::string> elements;
    std::vector<int> counts;
    double scale;
    std::size_t next_line;
};

// comment, scale, lattice, element and count lines shared by POSCAR and XDATCAR
PoscarHeader ReadHeader(const std::vector<std::string> &lines, std::size_t start, const fs::path &path)
{
    PoscarHeader header;
    double scale = std::stod(Trim(LineAt(lines, start + 1, path)));
    if (scale <= 0.0)
    {
        throw FormatError("Volume-style (negative) scale is not supported: " + path.string());
    }
    header.scale = scale;
    for (int i = 0; i < 3; ++i)
    {
        header.lattice.row(i) = ParseVector(SplitWhitespace(LineAt(lines, start + 2 + i, path)), path).transpose() * scale;
    }

    header.elements = SplitWhitespace(LineAt(lines, start + 5, path));
    if (header.elements.empty() || IsNumber(header.elements[0]))
    {
        throw FormatError("Element line missing (VASP4 layout) in " + path.string());
    }
    for (const auto &token : SplitWhitespace(LineAt(lines, start + 6, path)))
    {
        header.counts.push_back(std::stoi(token));
    }
    if (header.counts.size() != header.elements.size())
    {
        throw FormatError("Element and count lines disagree in " + path.string());
    }
    header.next_line = start + 7;
    return header;
}

std::vector<std::string> SplitComma(const std::string &text)
{
    std::vector<std::string> tokens;
    std::istringstream iss(text);
    std::string token;
    while (std::getline(iss, token, ','))
    {
        tokens.push_back(Trim(token));
    }
    return tokens;
}

void CollectNodes(const pt::ptree &node, const std::string &name, std::vector<const pt::ptree *> &found)
{
    for (const auto &child : node)
    {
        if (child.first == name)
        {
            found.push_back(&child.second);
        }
        CollectNodes(child.second, name, found);
    }
}

double Angle(const Eigen::Vector3d &u, const Eigen::Vector3d &v)
{
    return std::acos(u.dot(v) / (u.norm() * v.norm())) / kDegree;
}

} // namespace

Structure ReadPoscar(const fs::path &path)
{
    std::vector<std::string> lines = ReadLines(path);
    PoscarHeader header = ReadHeader(lines, 0, path);

    std::size_t index = header.next_line;
    bool selective = false;
    std::string mode = Trim(LineAt(lines, index, path));
    if (!mode.empty() && (mode[0] == 'S' || mode[0] == 's'))
    {
        selective = true;
        mode = Trim(LineAt(lines, ++index, path));
    }
    bool cartesian = !mode.empty() && (mode[0] == 'C' || mode[0] == 'c' || mode[0] == 'K' || mode[0] == 'k');
    ++index;

    Structure frame(header.lattice, {});
    std::vector<Atom> atoms;
    for (std::size_t e = 0; e < header.elements.size(); ++e)
    {
        for (int n = 0; n < header.counts[e]; ++n)
        {
            std::vector<std::string> tokens = SplitWhitespace(LineAt(lines, index++, path));
            Atom atom;
            atom.element = header.elements[e];
            Eigen::Vector3d coord = ParseVector(tokens, path);
            atom.frac = cartesian ? frame.FracCoord(coord * header.scale) : coord;
            if (selective)
            {
                if (tokens.size() < 6)
                {
                    throw FormatError("Selective dynamics flags missing in " + path.string());
                }
                for (int k = 0; k < 3; ++k)
                {
                    atom.relax[k] = ToUpper(tokens[3 + k]) != "F";
                }
            }
            atoms.push_back(atom);
        }
    }
    return Structure(header.lattice, atoms);
}

void WritePoscar(const Structure &structure, const fs::path &path, const std::string &comment)
{
    std::ofstream outfile(path.string());
    if (!outfile.is_open())
    {
        throw std::runtime_error("Cannot write file: " + path.string());
    }

    outfile << comment << "\n";
    outfile << "1.0\n";
    outfile << std::fixed << std::setprecision(16);
    for (int i = 0; i < 3; ++i)
    {
        outfile << std::setw(22) << structure.lattice()(i, 0)
                << std::setw(22) << structure.lattice()(i, 1)
                << std::setw(22) << structure.lattice()(i, 2) << "\n";
    }

    for (const auto &element : structure.Elements())
    {
        outfile << std::setw(5) << element;
    }
    outfile << "\n";
    for (int count : structure.ElementCounts())
    {
        outfile << std::setw(5) << count;
    }
    outfile << "\n";

    outfile << "Selective dynamics\n";
    outfile << "Direct\n";
    for (const auto &atom : structure.atoms())
    {
        outfile << std::setw(20) << atom.frac[0] << std::setw(20) << atom.frac[1] << std::setw(20) << atom.frac[2];
        for (int k = 0; k < 3; ++k)
        {
            outfile << "   " << (atom.relax[k] ? "T" : "F");
        }
        outfile << "\n";
    }
}

Structure ReadXsd(const fs::path &path)
{
    pt::ptree tree;
    pt::read_xml(path.string(), tree);

    std::vector<const pt::ptree *> groups;
    CollectNodes(tree, "SpaceGroup", groups);
    if (groups.empty())
    {
        throw FormatError("No periodic SpaceGroup found in " + path.string());
    }
    Eigen::Matrix3d lattice;
    const char *vectors[] = {"<xmlattr>.AVector", "<xmlattr>.BVector", "<xmlattr>.CVector"};
    for (int i = 0; i < 3; ++i)
    {
        lattice.row(i) = ParseVector(SplitComma(groups.front()->get<std::string>(vectors[i], "")), path).transpose();
    }

    std::vector<const pt::ptree *> nodes;
    CollectNodes(tree, "Atom3d", nodes);
    std::vector<Atom> atoms;
    for (const pt::ptree *node : nodes)
    {
        // periodic images carry ImageOf and are not real atoms
        if (node->get_optional<std::string>("<xmlattr>.ImageOf"))
        {
            continue;
        }
        std::string xyz = node->get<std::string>("<xmlattr>.XYZ", "");
        std::string element = node->get<std::string>("<xmlattr>.Components", "");
        if (xyz.empty() || element.empty())
        {
            continue;
        }

        Atom atom;
        atom.element = element;
        atom.frac = ParseVector(SplitComma(xyz), path);
        if (node->get<std::string>("<xmlattr>.RestrictedProperties", "").find("FractionalXYZ") != std::string::npos)
        {
            atom.relax = {{false, false, false}};
        }
        boost::optional<double> spin = node->get_optional<double>("<xmlattr>.FormalSpin");
        if (spin)
        {
            atom.spin = *spin;
        }
        atom.constrained = node->get<std::string>("<xmlattr>.Name", "").find("constrain") != std::string::npos;
        atoms.push_back(atom);
    }
    if (atoms.empty())
    {
        throw FormatError("No atoms found in " + path.string());
    }
    return Structure(lattice, GroupByElement(atoms));
}

std::vector<Structure> ReadXdatcar(const fs::path &path)
{
    std::vector<std::string> lines = ReadLines(path);
    std::vector<Structure> frames;
    PoscarHeader header = ReadHeader(lines, 0, path);
    std::size_t index = header.next_line;

    while (index < lines.size())
    {
        std::string line = Trim(lines[index]);
        if (line.empty())
        {
            ++index;
            continue;
        }
        if (line.find("configuration") == std::string::npos)
        {
            // variable-cell runs repeat the header before every frame
            header = ReadHeader(lines, index, path);
            index = header.next_line;
            continue;
        }
        ++index;

        std::vector<Atom> atoms;
        for (std::size_t e = 0; e < header.elements.size(); ++e)
        {
            for (int n = 0; n < header.counts[e]; ++n)
            {
                Atom atom;
                atom.element = header.elements[e];
                atom.frac = ParseVector(SplitWhitespace(LineAt(lines, index++, path)), path);
                atoms.push_back(atom);
            }
        }
        frames.push_back(Structure(header.lattice, atoms));
    }
    return frames;
}

void WriteArc(const std::vector<Structure> &frames, const fs::path &path)
{
    std::ofstream outfile(path.string());
    if (!outfile.is_open())
    {
        throw std::runtime_error("Cannot write file: " + path.string());
    }

    char date[64];
    std::time_t now = std::time(nullptr);
    std::strftime(date, sizeof(date), "%a %b %d %H:%M:%S %Y", std::localtime(&now));

    outfile << "!BIOSYM archive 3\n";
    outfile << "PBC=ON\n";
    for (std::size_t f = 0; f < frames.size(); ++f)
    {
        const Structure &frame = frames[f];
        Eigen::Vector3d a = frame.lattice().row(0).transpose();
        Eigen::Vector3d b = frame.lattice().row(1).transpose();
        Eigen::Vector3d c = frame.lattice().row(2).transpose();
        double alpha = Angle(b, c), beta = Angle(a, c), gamma = Angle(a, b);

        // car files expect a along x and b in the xy plane
        double ca = std::cos(alpha * kDegree), cb = std::cos(beta * kDegree);
        double cg = std::cos(gamma * kDegree), sg = std::sin(gamma * kDegree);
        Eigen::Matrix3d standard = Eigen::Matrix3d::Zero();
        standard.row(0) << a.norm(), 0.0, 0.0;
        standard.row(1) << b.norm() * cg, b.norm() * sg, 0.0;
        double cx = c.norm() * cb, cy = c.norm() * (ca - cb * cg) / sg;
        standard.row(2) << cx, cy, std::sqrt(c.squaredNorm() - cx * cx - cy * cy);

        outfile << "Frame " << f + 1 << " generated by vaspflow\n";
        outfile << "!DATE " << date << "\n";
        outfile << std::fixed << std::setprecision(4)
                << "PBC" << std::setw(10) << a.norm() << std::setw(10) << b.norm() << std::setw(10) << c.norm()
                << std::setw(10) << alpha << std::setw(10) << beta << std::setw(10) << gamma << " (P1)\n";

        outfile << std::setprecision(9);
        for (std::size_t i = 0; i < frame.size(); ++i)
        {
            const Atom &atom = frame.atoms()[i];
            Eigen::Vector3d cart = standard.transpose() * atom.frac;
            std::string name = atom.element + std::to_string(i + 1);
            outfile << std::left << std::setw(5) << name << std::right
                    << std::setw(15) << cart[0] << std::setw(15) << cart[1] << std::setw(15) << cart[2]
                    << " XXXX 1      xx      " << std::left << std::setw(2) << atom.element << std::right << "  0.000\n";
        }
        outfile << "end\n";
        outfile << "end\n";
    }
}
