#include "neb.h"
#include "errors.h"
#include "logger.h"
#include "structure_io.h"
#include "tool.h"
#include "vasp_tool.h"
#include "vibration.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>

namespace
{

bool IsImageDirName(const std::string &name)
{
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c)
                                        { return std::isdigit(c); });
}

void CheckComposition(const Structure &ini, const Structure &fni, const fs::path &ini_poscar, const fs::path &fni_poscar)
{
    if (ini != fni)
    {
        throw CompositionMismatchError(ini_poscar.string() + " and " + fni_poscar.string() + " are not structure match");
    }
}

void CheckImageCount(int images)
{
    if (images < 1)
    {
        throw InvalidOptionError("At least one interior image is needed, got " + std::to_string(images));
    }
}

void CopyEndpoint(const fs::path &source, const fs::path &target)
{
    if (fs::exists(target) && fs::equivalent(source, target))
    {
        return;
    }
    CopyFile(source, target);
}

} // namespace

std::string ImageDirName(int index)
{
    char name[16];
    std::snprintf(name, sizeof(name), "%02d", index);
    return name;
}

std::vector<fs::path> SearchImageDirs(const fs::path &work_dir)
{
    std::vector<fs::path> dirs;
    for (fs::directory_iterator it(work_dir), end; it != end; ++it)
    {
        if (fs::is_directory(it->path()) && IsImageDirName(it->path().filename().string()))
        {
            dirs.push_back(it->path());
        }
    }
    std::sort(dirs.begin(), dirs.end(), [](const fs::path &a, const fs::path &b)
              { return std::stoi(a.filename().string()) < std::stoi(b.filename().string()); });
    return dirs;
}

////////////////////////// ImagePathGenerator //////////////////////////

void ImagePathGenerator::Linear(const fs::path &ini_poscar, const fs::path &fni_poscar, int images) const
{
    CheckImageCount(images);
    Structure ini = ReadPoscar(ini_poscar);
    Structure fni = ReadPoscar(fni_poscar);
    // 组成不一致时不创建任何目录
    CheckComposition(ini, fni, ini_poscar, fni_poscar);

    CopyEndpoint(ini_poscar, work_dir_ / ImageDirName(0) / POSCAR);
    CopyEndpoint(fni_poscar, work_dir_ / ImageDirName(images + 1) / POSCAR);

    for (int k = 1; k <= images; ++k)
    {
        std::vector<Eigen::Vector3d> carts;
        for (std::size_t i = 0; i < ini.size(); ++i)
        {
            Eigen::Vector3d start = ini.CartCoord(i);
            Eigen::Vector3d displacement = (fni.CartCoord(i) - start) / (images + 1);
            carts.push_back(start + displacement * k);
        }
        fs::path image_dir = work_dir_ / ImageDirName(k);
        MakeDirectory(image_dir);
        WritePoscar(ini.WithCartCoords(carts), image_dir / POSCAR, "image " + ImageDirName(k));
    }
    LOG_INFO("Linear interpolation of NEB initial guess has been generated.");
}

void ImagePathGenerator::Idpp(const fs::path &ini_poscar, const fs::path &fni_poscar, int images, PathSolver &solver) const
{
    CheckImageCount(images);
    Structure ini = ReadPoscar(ini_poscar);
    Structure fni = ReadPoscar(fni_poscar);
    CheckComposition(ini, fni, ini_poscar, fni_poscar);

    fs::path scratch = work_dir_ / ".idpp";
    solver.Solve(fs::absolute(ini_poscar), fs::absolute(fni_poscar), images, scratch);
    for (int k = 0; k <= images + 1; ++k)
    {
        CopyFile(scratch / ImageDirName(k) / POSCAR, work_dir_ / ImageDirName(k) / POSCAR);
    }
    fs::remove_all(scratch);
    LOG_INFO("Improved interpolation of NEB initial guess has been generated.");
}

void ImagePathGenerator::Generate(PathMethod method, const fs::path &ini_poscar, const fs::path &fni_poscar, int images, PathSolver &solver) const
{
    switch (method)
    {
    case PathMethod::Linear:
        Linear(ini_poscar, fni_poscar, images);
        break;
    case PathMethod::Idpp:
        Idpp(ini_poscar, fni_poscar, images, solver);
        break;
    }
}

////////////////////////// Overlap / Monitor //////////////////////////

std::vector<OverlapReport> CheckOverlap(const fs::path &work_dir, double min_distance)
{
    LOG_INFO("Check structures overlap");
    std::vector<OverlapReport> reports;
    for (const auto &dir : SearchImageDirs(work_dir))
    {
        Structure structure = ReadPoscar(dir / POSCAR);
        std::vector<OverlapPair> overlaps = structure.FindOverlaps(min_distance);
        if (overlaps.empty())
        {
            LOG_INFO("check " << dir.filename().string() << " dir... ok");
            continue;
        }
        for (const auto &pair : overlaps)
        {
            LOG_ERROR("image " << dir.filename().string() << ": atoms " << pair.first + 1 << " and " << pair.second + 1
                               << " overlap, distance = " << std::fixed << std::setprecision(4) << pair.distance);
        }
        reports.push_back({dir, overlaps});
    }
    if (reports.empty())
    {
        LOG_INFO("All structures don't have overlap");
    }
    return reports;
}

std::vector<MonitorRow> Monitor(const fs::path &work_dir)
{
    std::vector<MonitorRow> rows;
    double reference = 0.0;
    for (const auto &dir : SearchImageDirs(work_dir))
    {
        MonitorRow row;
        row.image = dir.filename().string();
        row.energy = ReadLastEnergy(dir / OUTCAR);
        if (!ReadLastTangent(dir / OUTCAR, row.tangent))
        {
            row.tangent = 0.0;
        }
        if (rows.empty())
        {
            reference = row.energy;
        }
        row.barrier = row.energy - reference;
        rows.push_back(row);
    }
    return rows;
}

void PrintMonitor(const std::vector<MonitorRow> &rows, std::ostream &out)
{
    out << "image   tangent          energy       barrier\n";
    for (const auto &row : rows)
    {
        out << " " << row.image << " \t " << std::fixed << std::setprecision(6) << std::setw(10) << row.tangent
            << " \t " << row.energy << " \t " << row.barrier << "\n";
    }
}

////////////////////////// Sort / Movie //////////////////////////

Structure AlignEndpoint(const Structure &ini, const Structure &fni)
{
    std::vector<std::string> ini_elements = ini.Elements(), fni_elements = fni.Elements();
    std::vector<int> ini_counts = ini.ElementCounts(), fni_counts = fni.ElementCounts();
    for (std::size_t e = 0; e < ini_elements.size(); ++e)
    {
        auto found = std::find(fni_elements.begin(), fni_elements.end(), ini_elements[e]);
        if (found == fni_elements.end() || fni_counts[found - fni_elements.begin()] != ini_counts[e])
        {
            throw CompositionMismatchError("Endpoints differ in the number of " + ini_elements[e] + " atoms");
        }
    }
    if (ini.size() != fni.size())
    {
        throw CompositionMismatchError("Endpoints differ in atom count");
    }

    std::vector<bool> used(fni.size(), false);
    std::vector<Atom> aligned;
    for (const auto &atom : ini.atoms())
    {
        std::size_t best = fni.size();
        double best_distance = std::numeric_limits<double>::max();
        for (std::size_t j = 0; j < fni.size(); ++j)
        {
            if (used[j] || fni.atoms()[j].element != atom.element)
            {
                continue;
            }
            Eigen::Vector3d delta = fni.atoms()[j].frac - atom.frac;
            for (int k = 0; k < 3; ++k)
            {
                delta[k] -= std::round(delta[k]);
            }
            double distance = (ini.lattice().transpose() * delta).norm();
            if (distance < best_distance)
            {
                best_distance = distance;
                best = j;
            }
        }
        used[best] = true;
        aligned.push_back(fni.atoms()[best]);
    }
    return fni.WithAtoms(aligned);
}

void SortEndpoints(const fs::path &ini_poscar, const fs::path &fni_poscar)
{
    Structure ini = ReadPoscar(ini_poscar);
    Structure fni = ReadPoscar(fni_poscar);
    WritePoscar(AlignEndpoint(ini, fni), fni_poscar, "sorted to " + ini_poscar.filename().string());
    LOG_INFO(fni_poscar.string() << " has been sorted to follow " << ini_poscar.string());
}

void NebMovie(const fs::path &work_dir, const std::string &name)
{
    std::vector<Structure> frames;
    for (const auto &dir : SearchImageDirs(work_dir))
    {
        fs::path file = fs::exists(dir / CONTCAR) ? dir / CONTCAR : dir / POSCAR;
        frames.push_back(ReadPoscar(file));
    }
    if (frames.empty())
    {
        throw InputMissingError("No image directories found in " + work_dir.string());
    }
    WriteArc(frames, work_dir / name);
    LOG_INFO("Movie of " << frames.size() << " images written to " << name);
}

void TaskMovie(TaskType type, const fs::path &work_dir, const std::string &name, const std::string &freq)
{
    const TaskRule &rule = RuleFor(type);
    if (!rule.capabilities.produces_trajectory)
    {
        throw CapabilityError(std::string(rule.name) + " task has no trajectory to animate");
    }
    if (rule.capabilities.multi_image)
    {
        NebMovie(work_dir, name);
        return;
    }
    if (type == TaskType::Freq)
    {
        FreqMovie(work_dir, freq);
        return;
    }
    std::vector<Structure> frames = ReadXdatcar(work_dir / XDATCAR);
    if (frames.empty())
    {
        throw FormatError("No configurations in " + (work_dir / XDATCAR).string());
    }
    WriteArc(frames, work_dir / name);
    LOG_INFO("Movie of " << frames.size() << " frames written to " << name);
}
