#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "path_solver.h"
#include "structure.h"
#include "task.h"

namespace fs = boost::filesystem;

// 00, 01, ...
std::string ImageDirName(int index);

// numerically named sub-directories of work_dir, sorted by index
std::vector<fs::path> SearchImageDirs(const fs::path &work_dir);

// Writes images 00 .. images+1 under work_dir
class ImagePathGenerator
{
public:
    explicit ImagePathGenerator(const fs::path &work_dir) : work_dir_(work_dir) {}

    // endpoints copied as-is, interior images at start + (end - start) * k / (images + 1)
    void Linear(const fs::path &ini_poscar, const fs::path &fni_poscar, int images) const;

    // images produced by solver, copied verbatim
    void Idpp(const fs::path &ini_poscar, const fs::path &fni_poscar, int images, PathSolver &solver) const;

    void Generate(PathMethod method, const fs::path &ini_poscar, const fs::path &fni_poscar, int images, PathSolver &solver) const;

private:
    fs::path work_dir_;
};

struct OverlapReport
{
    fs::path image_dir;
    std::vector<OverlapPair> overlaps;
};

// Reloads every image directory; violations are logged and returned, never thrown
std::vector<OverlapReport> CheckOverlap(const fs::path &work_dir, double min_distance);

struct MonitorRow
{
    std::string image;
    double tangent;
    double energy;
    double barrier;
};

// energy / tangent of every image relative to image 00
std::vector<MonitorRow> Monitor(const fs::path &work_dir);
void PrintMonitor(const std::vector<MonitorRow> &rows, std::ostream &out);

// fni atoms reordered to follow ini (nearest same-element atom, minimum image)
Structure AlignEndpoint(const Structure &ini, const Structure &fni);
void SortEndpoints(const fs::path &ini_poscar, const fs::path &fni_poscar);

// movie.arc from CONTCAR (POSCAR when absent) of every image
void NebMovie(const fs::path &work_dir, const std::string &name);

// trajectory movie of a finished run; CapabilityError for tasks without one.
// Freq animates the vibration modes chosen by freq instead.
void TaskMovie(TaskType type, const fs::path &work_dir, const std::string &name, const std::string &freq = "image");
