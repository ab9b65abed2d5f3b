#include "path_solver.h"
#include "logger.h"
#include "tool.h"

#include <sstream>

std::string ExternalPathSolver::CommandLine(const fs::path &ini_poscar, const fs::path &fni_poscar, int images, const fs::path &out_dir) const
{
    std::ostringstream oss;
    oss << command_ << " " << ShellQuote(ini_poscar.string()) << " " << ShellQuote(fni_poscar.string())
        << " " << images << " " << ShellQuote(out_dir.string())
        << " --maxiter " << parameters_.maxiter
        << " --tol " << parameters_.tol
        << " --gtol " << parameters_.gtol
        << " --step " << parameters_.step_size
        << " --max-disp " << parameters_.max_disp
        << " --spring " << parameters_.spring_const;
    return oss.str();
}

void ExternalPathSolver::Solve(const fs::path &ini_poscar, const fs::path &fni_poscar, int images, const fs::path &out_dir)
{
    if (command_.empty())
    {
        throw std::runtime_error("No idpp command configured (set 'idpp' in config.yaml)");
    }
    MakeDirectory(out_dir);
    RunCommand(CommandLine(ini_poscar, fni_poscar, images, out_dir));
}
