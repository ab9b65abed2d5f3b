#pragma once

#include <string>
#include <vector>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

#define CHG_DIR "chg_calc"
#define DOS_DIR "dos_calc"
#define WF_DIR "wf_calc"

// File names
#define POSCAR "POSCAR"
#define INCAR "INCAR"
#define POTCAR "POTCAR"
#define KPOINTS "KPOINTS"
#define CONTCAR "CONTCAR"
#define WAVECAR "WAVECAR"
#define CHGCAR "CHGCAR"
#define OUTCAR "OUTCAR"
#define XDATCAR "XDATCAR"
#define FORT188 "fort.188"
#define KPATH_IN "KPATH.in"
#define SUBMIT_SCRIPT "submit.script"
#define MOVIE_ARC "movie.arc"

// Structural-model input and template suffixes
#define STRUCTURE_EXT ".xsd"
#define INCAR_SUFFIX "_INCAR"
#define UVALUE_SUFFIX "UValue.yaml"
#define SUBMIT_SUFFIX "submit.yaml"

////////////////////////// Utility Functions //////////////////////////

std::string ToUpper(std::string text);

std::string Trim(const std::string &text);

std::vector<std::string> SplitWhitespace(const std::string &text);

bool EndsWith(const std::string &text, const std::string &suffix);

// Last "energy(sigma->0)" value in an OUTCAR
double ReadLastEnergy(const fs::path &outcar);

// Last "tangent (spring, REAL)" projection of a VTST OUTCAR, false if none
bool ReadLastTangent(const fs::path &outcar, double &tangent);
