#include "vibration.h"
#include "errors.h"
#include "logger.h"
#include "structure_io.h"
#include "vasp_tool.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace
{

const double kPi = std::acos(-1.0);

bool IsNumber(const std::string &token)
{
    char *end = nullptr;
    std::strtod(token.c_str(), &end);
    return end != token.c_str() && *end == '\0';
}

bool IsDigits(const std::string &text)
{
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c)
                                        { return std::isdigit(c); });
}

//    2 f/i=    1.234567 THz     7.756905 2PiTHz   41.180000 cm-1     5.105000 meV
bool ParseModeHeader(const std::vector<std::string> &tokens, VibrationMode &mode)
{
    if (tokens.size() < 3 || !IsDigits(tokens[0]) || tokens[1].compare(0, 1, "f") != 0)
    {
        return false;
    }
    auto unit = std::find(tokens.begin(), tokens.end(), "cm-1");
    if (unit == tokens.begin() || unit == tokens.end() || !IsNumber(*(unit - 1)))
    {
        return false;
    }
    mode = VibrationMode();
    mode.index = std::stoi(tokens[0]);
    mode.imaginary = tokens[1].find("/i") != std::string::npos;
    mode.wavenumber = std::stod(*(unit - 1));
    return true;
}

} // namespace

std::vector<VibrationMode> ReadVibrationModes(const fs::path &outcar)
{
    std::ifstream infile(outcar.string());
    if (!infile.is_open())
    {
        throw std::runtime_error("Cannot open file: " + outcar.string());
    }

    std::vector<VibrationMode> modes;
    bool in_block = false;
    VibrationMode *current = nullptr;
    std::string line;
    while (std::getline(infile, line))
    {
        if (line.find("Eigenvectors and eigenvalues of the dynamical matrix") != std::string::npos)
        {
            // later blocks replace earlier ones
            modes.clear();
            current = nullptr;
            in_block = true;
            continue;
        }
        if (!in_block)
        {
            continue;
        }
        if (line.find("Eigenvectors after division by SQRT(mass)") != std::string::npos)
        {
            in_block = false;
            continue;
        }

        std::vector<std::string> tokens = SplitWhitespace(line);
        VibrationMode mode;
        if (ParseModeHeader(tokens, mode))
        {
            modes.push_back(mode);
            current = &modes.back();
        }
        else if (current && tokens.size() == 6 && std::all_of(tokens.begin(), tokens.end(), IsNumber))
        {
            current->positions.emplace_back(std::stod(tokens[0]), std::stod(tokens[1]), std::stod(tokens[2]));
            current->displacements.emplace_back(std::stod(tokens[3]), std::stod(tokens[4]), std::stod(tokens[5]));
        }
    }

    if (modes.empty())
    {
        throw FormatError("No vibration modes in " + outcar.string());
    }
    return modes;
}

std::vector<VibrationMode> SelectModes(const std::vector<VibrationMode> &modes, const std::string &freq)
{
    std::vector<VibrationMode> selected;
    if (freq == "all")
    {
        return modes;
    }
    if (freq == "image")
    {
        std::copy_if(modes.begin(), modes.end(), std::back_inserter(selected), [](const VibrationMode &mode)
                     { return mode.imaginary; });
        if (selected.empty())
        {
            LOG_WARNING("No imaginary frequency found");
        }
        return selected;
    }
    if (!IsDigits(freq))
    {
        throw InvalidOptionError("--freq takes image, all or a mode number, got " + freq);
    }
    int index = std::stoi(freq);
    for (const auto &mode : modes)
    {
        if (mode.index == index)
        {
            selected.push_back(mode);
            return selected;
        }
    }
    throw InvalidOptionError("No vibration mode " + freq + ", OUTCAR has " + std::to_string(modes.size()));
}

std::vector<Structure> AnimateMode(const Structure &structure, const VibrationMode &mode, int frames, double amplitude)
{
    if (mode.positions.size() != structure.size())
    {
        throw FormatError("Mode " + std::to_string(mode.index) + " has " + std::to_string(mode.positions.size()) +
                          " atoms, the structure has " + std::to_string(structure.size()));
    }

    std::vector<Structure> animation;
    for (int k = 0; k < frames; ++k)
    {
        double phase = amplitude * std::sin(2.0 * kPi * k / frames);
        std::vector<Eigen::Vector3d> carts;
        for (std::size_t i = 0; i < mode.positions.size(); ++i)
        {
            carts.push_back(mode.positions[i] + mode.displacements[i] * phase);
        }
        animation.push_back(structure.WithCartCoords(carts));
    }
    return animation;
}

std::vector<std::string> FreqMovie(const fs::path &work_dir, const std::string &freq)
{
    std::vector<VibrationMode> modes = SelectModes(ReadVibrationModes(work_dir / OUTCAR), freq);
    Structure structure = ReadPoscar(work_dir / POSCAR);

    std::vector<std::string> names;
    for (const auto &mode : modes)
    {
        std::string name = "freq" + std::to_string(mode.index) + ".arc";
        WriteArc(AnimateMode(structure, mode), work_dir / name);
        LOG_INFO("Mode " << mode.index << (mode.imaginary ? " (imaginary) " : " ") << mode.wavenumber
                         << " cm-1 written to " << name);
        names.push_back(name);
    }
    return names;
}
