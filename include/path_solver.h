#pragma once

#include <string>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

// idpp convergence settings
struct IdppParameters
{
    int maxiter = 5000;
    double tol = 1e-5;
    double gtol = 1e-3;
    double step_size = 0.05;
    double max_disp = 0.05;
    double spring_const = 5.0;
};

// Interpolates images between two endpoint POSCARs into <out_dir>/NN/POSCAR, NN = 00 .. images+1
class PathSolver
{
public:
    virtual ~PathSolver() = default;
    virtual void Solve(const fs::path &ini_poscar, const fs::path &fni_poscar, int images, const fs::path &out_dir) = 0;
};

// Runs a configured idpp executable
class ExternalPathSolver : public PathSolver
{
public:
    explicit ExternalPathSolver(const std::string &command, const IdppParameters &parameters = IdppParameters())
        : command_(command), parameters_(parameters) {}

    void Solve(const fs::path &ini_poscar, const fs::path &fni_poscar, int images, const fs::path &out_dir) override;

    std::string CommandLine(const fs::path &ini_poscar, const fs::path &fni_poscar, int images, const fs::path &out_dir) const;

private:
    std::string command_;
    IdppParameters parameters_;
};
