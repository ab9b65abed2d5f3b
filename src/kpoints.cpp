#include "kpoints.h"
#include "errors.h"
#include "vasp_tool.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

KMesh KMesh::Automatic(const Eigen::Matrix3d &lattice)
{
    KMesh mesh;
    mesh.mode_ = Mode::Automatic;
    for (int i = 0; i < 3; ++i)
    {
        double length = lattice.row(i).norm();
        mesh.grid_[i] = std::max(1, static_cast<int>(std::ceil(30.0 / length)));
    }
    return mesh;
}

KMesh KMesh::GammaOnly()
{
    KMesh mesh;
    mesh.mode_ = Mode::Gamma;
    mesh.grid_ = {{1, 1, 1}};
    return mesh;
}

KMesh KMesh::LinePath(const std::vector<KPathSegment> &segments, int points)
{
    if (segments.empty())
    {
        throw FormatError("Band structure k-path has no segments");
    }
    KMesh mesh;
    mesh.mode_ = Mode::Line;
    mesh.segments_ = segments;
    mesh.points_ = points;
    return mesh;
}

std::string KMesh::Render() const
{
    std::ostringstream oss;
    if (mode_ == Mode::Line)
    {
        oss << "Line-Mode KPOINTS\n";
        oss << points_ << "\n";
        oss << "Line-mode\n";
        oss << "Reciprocal\n";
        oss << std::fixed << std::setprecision(8);
        for (std::size_t i = 0; i < segments_.size(); ++i)
        {
            const KPathSegment &segment = segments_[i];
            if (i)
            {
                oss << "\n";
            }
            oss << std::setw(12) << segment.start[0] << std::setw(12) << segment.start[1] << std::setw(12) << segment.start[2]
                << "   ! " << segment.start_label << "\n";
            oss << std::setw(12) << segment.end[0] << std::setw(12) << segment.end[1] << std::setw(12) << segment.end[2]
                << "   ! " << segment.end_label << "\n";
        }
        return oss.str();
    }

    oss << "AutoGenerated\n";
    oss << "0\n";
    oss << "Gamma\n";
    oss << grid_[0] << " " << grid_[1] << " " << grid_[2] << "\n";
    oss << "0 0 0\n";
    return oss.str();
}

void KMesh::Write(const fs::path &path) const
{
    std::ofstream outfile(path.string());
    if (!outfile.is_open())
    {
        throw std::runtime_error("Cannot write file: " + path.string());
    }
    outfile << Render();
}

std::vector<KPathSegment> ReadKPath(const fs::path &path)
{
    std::ifstream infile(path.string());
    if (!infile.is_open())
    {
        throw std::runtime_error("Cannot open file: " + path.string());
    }

    // 前四行: 注释, 点数, Line-mode, Reciprocal
    std::string line;
    for (int i = 0; i < 4; ++i)
    {
        if (!std::getline(infile, line))
        {
            throw FormatError(path.string() + " is not a line-mode k-path");
        }
    }

    std::vector<std::pair<Eigen::Vector3d, std::string>> points;
    while (std::getline(infile, line))
    {
        std::string label;
        std::size_t mark = line.find('!');
        if (mark != std::string::npos)
        {
            label = Trim(line.substr(mark + 1));
            line = line.substr(0, mark);
        }
        std::vector<std::string> tokens = SplitWhitespace(line);
        if (tokens.empty())
        {
            continue;
        }
        if (tokens.size() < 3)
        {
            throw FormatError("Bad k-point line in " + path.string() + ": " + line);
        }
        if (label.empty() && tokens.size() > 3)
        {
            label = tokens[3];
        }
        points.push_back({Eigen::Vector3d(std::stod(tokens[0]), std::stod(tokens[1]), std::stod(tokens[2])), label});
    }

    if (points.empty() || points.size() % 2)
    {
        throw FormatError(path.string() + " must list k-points in start/end pairs");
    }

    std::vector<KPathSegment> segments;
    for (std::size_t i = 0; i < points.size(); i += 2)
    {
        KPathSegment segment;
        segment.start = points[i].first;
        segment.start_label = points[i].second;
        segment.end = points[i + 1].first;
        segment.end_label = points[i + 1].second;
        segments.push_back(segment);
    }
    return segments;
}
