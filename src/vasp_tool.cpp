#include "vasp_tool.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

////////////////////////// Utility Functions //////////////////////////

std::string ToUpper(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                   { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string Trim(const std::string &text)
{
    std::size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }
    std::size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::vector<std::string> SplitWhitespace(const std::string &text)
{
    std::istringstream iss(text);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

bool EndsWith(const std::string &text, const std::string &suffix)
{
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

double ReadLastEnergy(const fs::path &outcar)
{
    std::ifstream infile(outcar.string());
    if (!infile.is_open())
    {
        throw std::runtime_error("Cannot open file: " + outcar.string());
    }

    std::string line;
    std::string energy;
    while (std::getline(infile, line))
    {
        //   energy  without entropy=     -345.12  energy(sigma->0) =     -345.10
        std::size_t pos = line.find("energy(sigma->0) =");
        if (pos != std::string::npos)
        {
            energy = Trim(line.substr(pos + 18));
        }
    }

    if (energy.empty())
    {
        throw FormatError("No energy(sigma->0) entry in " + outcar.string());
    }
    return std::stod(energy);
}

bool ReadLastTangent(const fs::path &outcar, double &tangent)
{
    std::ifstream infile(outcar.string());
    if (!infile.is_open())
    {
        throw std::runtime_error("Cannot open file: " + outcar.string());
    }

    std::string line;
    bool found = false;
    while (std::getline(infile, line))
    {
        //  NEB: projections on to tangent (spring, REAL) :   0.000120  -0.351270
        std::size_t pos = line.find("tangent (spring, REAL)");
        if (pos == std::string::npos)
        {
            continue;
        }
        std::size_t colon = line.find(':', pos);
        if (colon == std::string::npos)
        {
            continue;
        }
        std::vector<std::string> tokens = SplitWhitespace(line.substr(colon + 1));
        if (tokens.size() >= 2)
        {
            tangent = std::stod(tokens[1]);
            found = true;
        }
    }
    return found;
}
