#pragma once

#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "structure.h"

namespace fs = boost::filesystem;

Structure ReadPoscar(const fs::path &path);

// VASP5 layout, always with Selective dynamics and Direct coordinates
void WritePoscar(const Structure &structure, const fs::path &path, const std::string &comment = "Generated by vaspflow");

// Materials Studio *.xsd
Structure ReadXsd(const fs::path &path);

// every configuration of a fixed-cell VASP5 XDATCAR
std::vector<Structure> ReadXdatcar(const fs::path &path);

// Materials Studio *.arc archive, one frame per structure
void WriteArc(const std::vector<Structure> &frames, const fs::path &path);
