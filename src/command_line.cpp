#include "command_line.h"
#include "errors.h"
#include "vasp_tool.h"

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace
{

po::options_description VisibleOptions()
{
    TaskFlags defaults;

    po::options_description general("General");
    general.add_options()
        ("help,h", "Show this help")
        ("workdir,w", po::value<std::string>()->default_value("."), "Working directory")
        ("potential", po::value<std::string>(), "Potential family (default from config.yaml)")
        ("continuous", po::bool_switch(), "Start from the newest CONTCAR of a previous run");

    po::options_description physics("Calculation");
    physics.add_options()
        ("low", po::bool_switch(), "Opt: low-precision first pass, then the template settings")
        ("vdw", po::bool_switch(), "DFT-D3 dispersion correction")
        ("sol", po::bool_switch(), "Implicit solvation")
        ("gamma", po::bool_switch(), "Gamma-only k-mesh")
        ("mag", po::bool_switch(), "Spin polarisation with MAGMOM from the structure")
        ("hse", po::bool_switch(), "HSE06 hybrid functional")
        ("static", po::bool_switch(), "Fixed ions")
        ("nelect", po::value<double>(), "Electrons added to the neutral valence")
        ("analysis", po::bool_switch(), "Chg: charge partitioning after the run")
        ("points", po::value<int>()->default_value(defaults.points), "Band: points per k-path segment")
        ("tebeg", po::value<double>()->default_value(defaults.tebeg), "MD: start temperature")
        ("teend", po::value<double>()->default_value(defaults.teend), "MD: end temperature");

    po::options_description neb("NEB / movie");
    neb.add_options()
        ("ini", po::value<std::string>(), "Initial-state POSCAR")
        ("fni", po::value<std::string>(), "Final-state POSCAR")
        ("images", po::value<int>()->default_value(defaults.images), "Number of interior images")
        ("method", po::value<std::string>()->default_value(defaults.method), "linear or idpp")
        ("check-overlap", po::bool_switch(), "Check image overlap (default)")
        ("no-check-overlap", po::bool_switch(), "Skip the image overlap check")
        ("name", po::value<std::string>()->default_value(MOVIE_ARC), "Movie file name")
        ("freq", po::value<std::string>()->default_value("image"), "Freq movie: image, all or a mode number");

    po::options_description visible;
    visible.add(general).add(physics).add(neb);
    return visible;
}

} // namespace

CommandLine ParseCommandLine(int argc, const char *const argv[])
{
    po::options_description hidden("Hidden");
    hidden.add_options()
        ("command", po::value<std::string>(), "")
        ("args", po::value<std::vector<std::string>>(), "");

    po::positional_options_description pos;
    pos.add("command", 1).add("args", -1);

    po::options_description all;
    all.add(VisibleOptions()).add(hidden);

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(all).positional(pos).run(), vm);
        po::notify(vm);
    }
    catch (const po::error &e)
    {
        throw InvalidOptionError(e.what());
    }

    CommandLine line;
    line.help = vm.count("help") > 0;
    if (vm.count("command"))
    {
        line.command = vm["command"].as<std::string>();
    }
    if (vm.count("args"))
    {
        line.args = vm["args"].as<std::vector<std::string>>();
    }
    line.work_dir = vm["workdir"].as<std::string>();
    line.movie_name = vm["name"].as<std::string>();
    line.freq = vm["freq"].as<std::string>();

    TaskFlags &flags = line.flags;
    flags.low = vm["low"].as<bool>();
    flags.vdw = vm["vdw"].as<bool>();
    flags.sol = vm["sol"].as<bool>();
    flags.gamma = vm["gamma"].as<bool>();
    flags.mag = vm["mag"].as<bool>();
    flags.hse = vm["hse"].as<bool>();
    flags.static_ions = vm["static"].as<bool>();
    flags.continuous = vm["continuous"].as<bool>();
    flags.analysis = vm["analysis"].as<bool>();
    flags.points = vm["points"].as<int>();
    flags.tebeg = vm["tebeg"].as<double>();
    flags.teend = vm["teend"].as<double>();
    flags.images = vm["images"].as<int>();
    flags.method = vm["method"].as<std::string>();
    if (vm.count("potential"))
    {
        flags.potential = vm["potential"].as<std::string>();
    }
    if (vm.count("nelect"))
    {
        flags.nelect = vm["nelect"].as<double>();
    }
    if (vm.count("ini"))
    {
        flags.ini_poscar = vm["ini"].as<std::string>();
    }
    if (vm.count("fni"))
    {
        flags.fni_poscar = vm["fni"].as<std::string>();
    }

    bool check = vm["check-overlap"].as<bool>();
    bool no_check = vm["no-check-overlap"].as<bool>();
    if (check && no_check)
    {
        throw InvalidOptionError("--check-overlap and --no-check-overlap cannot be used together");
    }
    flags.check_overlap = !no_check;
    return line;
}

void PrintUsage(std::ostream &out)
{
    out << "Usage: vaspflow <command> [args] [options]\n\n"
        << "Commands:\n"
        << "  opt chg dos band freq md stm cont dimer wf neb   generate a task in the working directory\n"
        << "  sequence <charge|dos|wf>                       optimisation chained to a follow-up stage\n"
        << "  neb-sort <ini> <fni>                           reorder fni atoms to follow ini\n"
        << "  neb-monitor                                    tangent / energy / barrier of every image\n"
        << "  movie <task>                                   render the trajectory to an .arc file\n\n"
        << VisibleOptions() << std::endl;
}
