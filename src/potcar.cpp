#include "potcar.h"
#include "errors.h"
#include "vasp_tool.h"

#include <fstream>
#include <sstream>

Potcar Potcar::Concatenate(const fs::path &pot_dir, const std::string &potential, const std::vector<std::string> &elements)
{
    Potcar potcar;
    for (const auto &element : elements)
    {
        fs::path source = pot_dir / potential / element / POTCAR;
        std::ifstream infile(source.string());
        if (!infile.is_open())
        {
            throw InputMissingError("Potential of " + element + " not found: " + source.string());
        }
        std::stringstream buffer;
        buffer << infile.rdbuf();

        PotcarBlock block;
        block.element = element;
        block.text = buffer.str();
        block.zval = ParseZval(block.text);
        potcar.blocks_.push_back(block);
    }
    return potcar;
}

double Potcar::Valence(const std::string &element) const
{
    for (const auto &block : blocks_)
    {
        if (block.element == element)
        {
            return block.zval;
        }
    }
    throw std::runtime_error("No potential block for element " + element);
}

double Potcar::TotalValence(const std::vector<std::string> &elements, const std::vector<int> &counts) const
{
    double total = 0.0;
    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        total += Valence(elements[i]) * counts.at(i);
    }
    return total;
}

void Potcar::Write(const fs::path &path) const
{
    std::ofstream outfile(path.string());
    if (!outfile.is_open())
    {
        throw std::runtime_error("Cannot write file: " + path.string());
    }
    for (const auto &block : blocks_)
    {
        outfile << block.text;
        if (!block.text.empty() && block.text.back() != '\n')
        {
            outfile << "\n";
        }
    }
}

double Potcar::ParseZval(const std::string &text)
{
    //    POMASS =   55.847; ZVAL   =    8.000    mass and valenz
    std::size_t pos = text.find("ZVAL");
    if (pos == std::string::npos)
    {
        throw FormatError("POTCAR block has no ZVAL entry");
    }
    std::size_t equal = text.find('=', pos);
    if (equal == std::string::npos)
    {
        throw FormatError("POTCAR ZVAL entry has no value");
    }
    std::vector<std::string> tokens = SplitWhitespace(text.substr(equal + 1, 32));
    if (tokens.empty())
    {
        throw FormatError("POTCAR ZVAL entry has no value");
    }
    return std::stod(tokens[0]);
}
