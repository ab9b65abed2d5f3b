#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include "config.h"
#include "incar.h"
#include "kpoints.h"
#include "path_solver.h"
#include "potcar.h"
#include "structure.h"
#include "submit_script.h"
#include "task.h"

namespace fs = boost::filesystem;

// One calculation directory: POSCAR, KPOINTS, POTCAR, INCAR and submit.script for a task
class VaspTask
{
public:
    VaspTask(const Config &config, TaskType type, const TaskFlags &flags);

    // band path source, vaspkit unless replaced
    void SetKPathProvider(std::shared_ptr<KPathProvider> provider) { kpath_provider_ = provider; }
    // idpp solver, the configured external command unless replaced
    void SetPathSolver(std::shared_ptr<PathSolver> solver) { path_solver_ = solver; }

    // Prepare(), then write the submit script and print the summary
    void Generate();

    // every state up to and including the in-memory submit script
    void Prepare();

    void GeneratePOSCAR();
    void GenerateKPOINTS();
    void GeneratePOTCAR();
    void GenerateINCAR();
    void PostStep();
    void BuildSubmitScript();
    void WriteSubmitScript() const;
    void PrintSummary(std::ostream &out) const;

    const Config &config() const { return config_; }
    TaskType type() const { return type_; }
    const TaskFlags &flags() const { return flags_; }
    const Structure &structure() const { return structure_; }
    const Incar &incar() const { return incar_; }
    const KMesh &kmesh() const;
    const Potcar &potcar() const { return potcar_; }
    double valence() const { return valence_; }
    SubmitScript &script() { return script_; }
    const SubmitScript &script() const { return script_; }
    const SchedulerTemplate &scheduler() const { return scheduler_; }

private:
    fs::path WorkPath(const fs::path &path) const;
    fs::path FindStructureFile() const;
    fs::path LatestContcar() const;
    void CarrySpins();
    void GenerateImages();
    void WriteConstraint() const;
    void AppendSecondPass();

    Config config_;
    TaskType type_;
    TaskFlags flags_;
    std::string potential_;

    std::shared_ptr<KPathProvider> kpath_provider_;
    std::shared_ptr<PathSolver> path_solver_;

    Structure structure_;
    boost::optional<KMesh> kmesh_;
    Potcar potcar_;
    double valence_ = 0.0;
    Incar template_;
    Incar incar_;
    SchedulerTemplate scheduler_;
    SubmitScript script_;
};
