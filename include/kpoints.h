#pragma once

#include <array>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

struct KPathSegment
{
    std::string start_label;
    std::string end_label;
    Eigen::Vector3d start = Eigen::Vector3d::Zero();
    Eigen::Vector3d end = Eigen::Vector3d::Zero();
};

class KMesh
{
public:
    enum class Mode
    {
        Automatic,
        Gamma,
        Line
    };

    // Gamma-centred grid with max(1, ceil(30 / |a_i|)) divisions per axis
    static KMesh Automatic(const Eigen::Matrix3d &lattice);
    static KMesh GammaOnly();
    static KMesh LinePath(const std::vector<KPathSegment> &segments, int points);

    Mode mode() const { return mode_; }
    const std::array<int, 3> &grid() const { return grid_; }
    const std::vector<KPathSegment> &segments() const { return segments_; }
    int points() const { return points_; }

    std::string Render() const;
    void Write(const fs::path &path) const;

private:
    KMesh() = default;

    Mode mode_ = Mode::Automatic;
    std::array<int, 3> grid_ = {{1, 1, 1}};
    std::vector<KPathSegment> segments_;
    int points_ = 0;
};

// Source of the high-symmetry band path for a structure
class KPathProvider
{
public:
    virtual ~KPathProvider() = default;
    virtual std::vector<KPathSegment> FindPath(const fs::path &work_dir) = 0;
};

// Parse a line-mode KPOINTS / KPATH.in file into labelled segments
std::vector<KPathSegment> ReadKPath(const fs::path &path);
