#pragma once

#include <string>
#include <vector>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

struct PotcarBlock
{
    std::string element;
    double zval;
    std::string text;
};

// POTCAR assembled from <pot_dir>/<potential>/<element>/POTCAR in element order
class Potcar
{
public:
    static Potcar Concatenate(const fs::path &pot_dir, const std::string &potential, const std::vector<std::string> &elements);

    const std::vector<PotcarBlock> &blocks() const { return blocks_; }

    double Valence(const std::string &element) const;

    // neutral electron count, sum of count * ZVAL
    double TotalValence(const std::vector<std::string> &elements, const std::vector<int> &counts) const;

    void Write(const fs::path &path) const;

    static double ParseZval(const std::string &text);

private:
    std::vector<PotcarBlock> blocks_;
};
