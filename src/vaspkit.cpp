#include "vaspkit.h"
#include "vasp_tool.h"

std::vector<KPathSegment> VaspkitKPathProvider::FindPath(const fs::path &work_dir)
{
    VaspkitManager vaspkit(command_);
    vaspkit.startVaspkit(work_dir, "kpath");
    vaspkit.sendInputToVaspkit("3\n");
    vaspkit.sendInputToVaspkit("303\n");
    vaspkit.stopVaspkit();

    fs::path kpath = work_dir / KPATH_IN;
    if (!fs::exists(kpath))
    {
        throw std::runtime_error("VASPKIT did not produce " + kpath.string() + ", see " + vaspkit.getOutputFilename());
    }
    LOG_INFO("High-symmetry path read from " << kpath.string());
    return ReadKPath(kpath);
}
