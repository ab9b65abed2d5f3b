#pragma once

#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include "incar.h"
#include "structure.h"
#include "uvalue.h"

namespace fs = boost::filesystem;

enum class TaskType
{
    Opt,
    Charge,
    DOS,
    Band,
    Freq,
    MD,
    STM,
    ConTS,
    Dimer,
    WorkFunc,
    NEB
};

enum class PathMethod
{
    Linear,
    Idpp
};

// throws UnsupportedMethodError
PathMethod ParsePathMethod(const std::string &name);

struct TaskFlags
{
    bool low = false;
    bool vdw = false;
    bool sol = false;
    bool gamma = false;
    bool mag = false;
    bool hse = false;
    bool static_ions = false;
    bool continuous = false;
    bool analysis = false;
    bool check_overlap = true;
    boost::optional<double> nelect; // electrons added to the neutral valence

    std::string method = "linear";
    int points = 20;  // band k-path density
    int images = 4;
    fs::path ini_poscar;
    fs::path fni_poscar;

    double tebeg = 300.0;
    double teend = 300.0;
    std::string potential; // empty: the configured family
};

struct TaskCapabilities
{
    bool produces_trajectory;
    bool requires_constraint_pair;
    bool multi_image;
    bool line_mode_kpoints;
    bool relaxes_ions; // completion is checked as an optimisation, not a single point
};

typedef void (*OverrideFunction)(Incar &incar, const TaskFlags &flags);

struct TaskRule
{
    TaskType type;
    const char *name;    // summary / log name
    const char *command; // command-line name
    TaskCapabilities capabilities;
    OverrideFunction apply;
};

const std::vector<TaskRule> &TaskRules();
const TaskRule &RuleFor(TaskType type);

// command-line name to task, throws UnsupportedTaskError
TaskType ParseTaskType(const std::string &command);

// Rejects flag values the task cannot use (NEB method, image count, band points)
// before anything is written; throws UnsupportedMethodError or InvalidOptionError
void ValidateFlags(TaskType type, const TaskFlags &flags);

// check_opt when the run relaxes ions, check_scf for single points and --static
const char *CompletionCheck(TaskType type, const TaskFlags &flags);

// LDAUL/LDAUU/LDAUJ/LMAXMIX, one value per element; only when the template enables LDAU
void ApplyUCorrection(Incar &incar, const std::vector<std::string> &elements, const UValueTable &table);

// vdw, sol, mag, hse, static, nelect
void ApplyFlagOverrides(Incar &incar, const TaskFlags &flags, const Structure &structure, double valence);

// U correction (skipped for hse), then the variant table, then the flags
void BuildIncar(Incar &incar, TaskType type, const TaskFlags &flags, const Structure &structure,
                const UValueTable &table, double valence);
