#pragma once

#include <string>
#include <vector>
#include <Eigen/Dense>
#include <boost/filesystem.hpp>
#include "structure.h"

namespace fs = boost::filesystem;

struct VibrationMode
{
    int index;       // numbering used by OUTCAR, from 1
    bool imaginary;  // "f/i="
    double wavenumber; // cm-1
    std::vector<Eigen::Vector3d> positions;     // Cartesian
    std::vector<Eigen::Vector3d> displacements; // dx dy dz
};

// Modes of the last "Eigenvectors and eigenvalues of the dynamical matrix" block
std::vector<VibrationMode> ReadVibrationModes(const fs::path &outcar);

// "image" for imaginary modes, "all", or a mode number; throws InvalidOptionError
std::vector<VibrationMode> SelectModes(const std::vector<VibrationMode> &modes, const std::string &freq);

// one period of the mode around its equilibrium positions
std::vector<Structure> AnimateMode(const Structure &structure, const VibrationMode &mode, int frames = 20, double amplitude = 1.0);

// freq<N>.arc for every selected mode of the OUTCAR in work_dir, cell from POSCAR
std::vector<std::string> FreqMovie(const fs::path &work_dir, const std::string &freq);
