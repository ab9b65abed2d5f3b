#include "vasp.h"
#include "errors.h"
#include "logger.h"
#include "neb.h"
#include "structure_io.h"
#include "tool.h"
#include "uvalue.h"
#include "vasp_tool.h"
#include "vaspkit.h"

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace
{

// MAGMOM may use VASP's N*value shorthand
std::vector<double> ExpandMagmom(const IncarList &values)
{
    std::vector<double> moments;
    for (const auto &value : values)
    {
        std::string token = Incar::FormatScalar(value);
        std::size_t star = token.find('*');
        if (star == std::string::npos)
        {
            moments.push_back(std::stod(token));
            continue;
        }
        int repeat = std::stoi(token.substr(0, star));
        double moment = std::stod(token.substr(star + 1));
        moments.insert(moments.end(), repeat, moment);
    }
    return moments;
}

std::string MeshText(const KMesh &mesh)
{
    switch (mesh.mode())
    {
    case KMesh::Mode::Line:
        return "line-mode, " + std::to_string(mesh.segments().size()) + " segments x " + std::to_string(mesh.points());
    case KMesh::Mode::Gamma:
        return "[1, 1, 1]";
    default:
        return "[" + std::to_string(mesh.grid()[0]) + ", " + std::to_string(mesh.grid()[1]) + ", " + std::to_string(mesh.grid()[2]) + "]";
    }
}

} // namespace

////////////////////////// VaspTask //////////////////////////

VaspTask::VaspTask(const Config &config, TaskType type, const TaskFlags &flags)
    : config_(config), type_(type), flags_(flags)
{
    potential_ = flags_.potential.empty() ? config_.potential : flags_.potential;
}

fs::path VaspTask::WorkPath(const fs::path &path) const
{
    return path.is_absolute() ? path : config_.work_dir / path;
}

const KMesh &VaspTask::kmesh() const
{
    if (!kmesh_)
    {
        throw std::runtime_error("KPOINTS has not been generated yet");
    }
    return *kmesh_;
}

void VaspTask::Generate()
{
    Prepare();
    WriteSubmitScript();
    PrintSummary(std::cout);
}

void VaspTask::Prepare()
{
    const TaskRule &rule = RuleFor(type_);
    // 在任何文件写入之前检查参数
    ValidateFlags(type_, flags_);
    scheduler_ = SchedulerTemplate::Load(config_.submit_template);

    DEBUG_PRINT("Generating " << rule.name << " task in " << config_.work_dir.string());
    GeneratePOSCAR();
    GenerateKPOINTS();
    GeneratePOTCAR();
    GenerateINCAR();
    PostStep();
    BuildSubmitScript();
}

////////////////////////// Structure //////////////////////////

fs::path VaspTask::FindStructureFile() const
{
    std::vector<fs::path> found;
    for (fs::directory_iterator it(config_.work_dir), end; it != end; ++it)
    {
        if (fs::is_regular_file(it->path()) && it->path().extension() == STRUCTURE_EXT)
        {
            found.push_back(it->path());
        }
    }
    if (found.empty())
    {
        throw InputMissingError("*.xsd file is not found, please check workdir");
    }
    if (found.size() > 1)
    {
        throw InputAmbiguousError("exist more than one *.xsd file, please check workdir");
    }
    return found.front();
}

fs::path VaspTask::LatestContcar() const
{
    fs::path latest;
    std::time_t latest_time = 0;
    for (fs::directory_iterator it(config_.work_dir), end; it != end; ++it)
    {
        if (fs::is_regular_file(it->path()) && it->path().filename().string().find(CONTCAR) == 0)
        {
            std::time_t last_write = fs::last_write_time(it->path());
            if (latest.empty() || last_write > latest_time)
            {
                latest_time = last_write;
                latest = it->path();
            }
        }
    }
    if (latest.empty())
    {
        throw InputMissingError("No CONTCAR found in " + config_.work_dir.string() + " to continue from");
    }
    return latest;
}

void VaspTask::CarrySpins()
{
    fs::path previous = config_.work_dir / INCAR;
    if (!fs::exists(previous))
    {
        return;
    }
    Incar incar = Incar::Load(previous);
    std::vector<double> moments = ExpandMagmom(incar.GetList("MAGMOM"));
    if (moments.empty())
    {
        return;
    }
    if (moments.size() != structure_.size())
    {
        LOG_WARNING("MAGMOM of previous INCAR has " << moments.size() << " values for " << structure_.size() << " atoms, spins not carried");
        return;
    }

    std::vector<Atom> atoms = structure_.atoms();
    for (std::size_t i = 0; i < atoms.size(); ++i)
    {
        atoms[i].spin = moments[i];
    }
    structure_ = structure_.WithAtoms(atoms);
    if (incar.Get<int>("ISPIN", 1) == 2)
    {
        flags_.mag = true;
    }
    LOG_INFO("Spin state carried from previous INCAR");
}

void VaspTask::GeneratePOSCAR()
{
    if (RuleFor(type_).capabilities.multi_image)
    {
        GenerateImages();
        return;
    }

    if (flags_.continuous)
    {
        fs::path contcar = LatestContcar();
        LOG_INFO("Continue from " << contcar.filename().string());
        structure_ = ReadPoscar(contcar);
        CarrySpins();
    }
    else
    {
        structure_ = ReadXsd(FindStructureFile());
    }
    WritePoscar(structure_, config_.work_dir / POSCAR);
}

void VaspTask::GenerateImages()
{
    if (flags_.ini_poscar.empty() || flags_.fni_poscar.empty())
    {
        throw InputMissingError("NEB task needs both --ini and --fni POSCAR files");
    }
    fs::path ini = WorkPath(flags_.ini_poscar);
    fs::path fni = WorkPath(flags_.fni_poscar);
    structure_ = ReadPoscar(ini);

    if (!path_solver_)
    {
        path_solver_ = std::make_shared<ExternalPathSolver>(config_.idpp_command);
    }
    ImagePathGenerator generator(config_.work_dir);
    generator.Generate(ParsePathMethod(flags_.method), ini, fni, flags_.images, *path_solver_);

    if (flags_.check_overlap)
    {
        CheckOverlap(config_.work_dir, config_.overlap_distance);
    }
}

////////////////////////// KPOINTS / POTCAR / INCAR //////////////////////////

void VaspTask::GenerateKPOINTS()
{
    const TaskRule &rule = RuleFor(type_);
    if (rule.capabilities.line_mode_kpoints)
    {
        if (!kpath_provider_)
        {
            kpath_provider_ = std::make_shared<VaspkitKPathProvider>(config_.vaspkit_command);
        }
        kmesh_ = KMesh::LinePath(kpath_provider_->FindPath(config_.work_dir), flags_.points);
    }
    else if (flags_.gamma || (type_ == TaskType::Opt && flags_.low))
    {
        kmesh_ = KMesh::GammaOnly();
    }
    else
    {
        kmesh_ = KMesh::Automatic(structure_.lattice());
    }
    kmesh_->Write(config_.work_dir / KPOINTS);
}

void VaspTask::GeneratePOTCAR()
{
    potcar_ = Potcar::Concatenate(config_.pot_dir, potential_, structure_.Elements());
    potcar_.Write(config_.work_dir / POTCAR);
    valence_ = potcar_.TotalValence(structure_.Elements(), structure_.ElementCounts());
}

void VaspTask::GenerateINCAR()
{
    template_ = Incar::Load(config_.incar_template);
    incar_ = template_;

    UValueTable table;
    if (!flags_.hse && incar_.Get<bool>("LDAU", false))
    {
        table = UValueTable::Load(config_.uvalue_file);
    }
    BuildIncar(incar_, type_, flags_, structure_, table, valence_);
    incar_.Write(config_.work_dir / INCAR);
}

////////////////////////// Post step //////////////////////////

void VaspTask::PostStep()
{
    if (RuleFor(type_).capabilities.requires_constraint_pair)
    {
        WriteConstraint();
    }
}

void VaspTask::WriteConstraint() const
{
    std::vector<std::size_t> constrained = structure_.ConstrainedAtoms();
    if (constrained.size() != 2)
    {
        throw ConstraintCountError("Number of constrain atoms should equal to 2, found " + std::to_string(constrained.size()));
    }

    double distance = structure_.Distance(constrained[0], constrained[1]);
    fs::path path = config_.work_dir / FORT188;
    std::ofstream outfile(path.string());
    if (!outfile.is_open())
    {
        throw std::runtime_error("Cannot write file: " + path.string());
    }
    outfile << "1\n3\n6\n3\n0.03\n";
    outfile << constrained[0] + 1 << " " << constrained[1] + 1 << " " << std::fixed << std::setprecision(4) << distance << "\n";
    outfile << "0\n";

    LOG_INFO("Constrain Information: " << constrained[0] + 1 << "-" << constrained[1] + 1
                                       << ", distance = " << std::fixed << std::setprecision(4) << distance);
}

////////////////////////// Submit script //////////////////////////

void VaspTask::BuildSubmitScript()
{
    const char *check = CompletionCheck(type_, flags_);

    script_ = SubmitScript();
    script_.AddFragment(FRAGMENT_HEADER)
        .AddFragment(FRAGMENT_ENVIRONMENT)
        .AddFragment(FRAGMENT_RUN);
    if (RuleFor(type_).capabilities.multi_image)
    {
        // VASP writes one OUTCAR per interior image
        for (int k = 1; k <= flags_.images; ++k)
        {
            script_.ChangeDir(ImageDirName(k))
                .AddFragment(check)
                .ChangeDir("..");
        }
    }
    else
    {
        script_.AddFragment(check);
    }

    if (type_ == TaskType::Opt && flags_.low)
    {
        AppendSecondPass();
    }
    if (type_ == TaskType::Charge && flags_.analysis)
    {
        script_.AddFragment(FRAGMENT_ANALYSIS);
    }
    script_.AddFragment(FRAGMENT_FINISH);
}

void VaspTask::AppendSecondPass()
{
    IncarPatch restore;
    const std::vector<std::string> keys = {"ENCUT", "PREC"};
    for (const auto &key : keys)
    {
        if (template_.Has(key))
        {
            restore.Set(key, template_.Get<std::string>(key, ""));
        }
        else
        {
            restore.Delete(key);
        }
    }

    script_.AddComment("second pass with the template cutoff, precision and k-mesh")
        .AddCommand("cp CONTCAR POSCAR")
        .EditIncar(INCAR, restore)
        .AddFile(KPOINTS, (flags_.gamma ? KMesh::GammaOnly() : KMesh::Automatic(structure_.lattice())).Render())
        .AddFragment(FRAGMENT_RUN)
        .AddFragment(FRAGMENT_CHECK_OPT);
}

void VaspTask::WriteSubmitScript() const
{
    script_.Write(config_.work_dir / SUBMIT_SCRIPT, scheduler_);
}

////////////////////////// Summary //////////////////////////

void VaspTask::PrintSummary(std::ostream &out) const
{
    std::vector<std::string> elements = structure_.Elements();
    std::vector<int> counts = structure_.ElementCounts();
    IncarList ldaul = incar_.GetList("LDAUL");
    IncarList ldauu = incar_.GetList("LDAUU");
    IncarList ldauj = incar_.GetList("LDAUJ");

    out << "---------------general info (#" << RuleFor(type_).name << ")-----------------------\n";
    out << "Elements    Total  Relax   potential orbital UValue\n";
    for (std::size_t i = 0; i < elements.size(); ++i)
    {
        std::string orbital = "-", uvalue = "-";
        if (i < ldaul.size() && i < ldauu.size() && i < ldauj.size())
        {
            orbital = Incar::FormatScalar(ldaul[i]);
            std::ostringstream oss;
            oss << std::stod(Incar::FormatScalar(ldauu[i])) - std::stod(Incar::FormatScalar(ldauj[i]));
            uvalue = oss.str();
        }
        out << std::setw(6) << elements[i] << "    "
            << std::setw(6) << counts[i]
            << std::setw(6) << structure_.RelaxedCount(elements[i]) << "(T)   "
            << potential_ << "    " << orbital << "     " << uvalue << "\n";
    }
    out << "\n";
    if (kmesh_)
    {
        out << "KPoints: " << MeshText(*kmesh_) << "\n";
    }
    out << "------------------------------------------------------------------\n";
}
