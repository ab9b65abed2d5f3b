#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "command_line.h"
#include "config.h"
#include "errors.h"
#include "logger.h"
#include "neb.h"
#include "sequencer.h"
#include "task.h"
#include "vasp.h"

namespace fs = boost::filesystem;

namespace
{

const std::string &Argument(const std::vector<std::string> &args, std::size_t index, const std::string &what)
{
    if (index >= args.size())
    {
        throw std::runtime_error("Missing argument: " + what);
    }
    return args[index];
}

} // namespace

int main(int argc, char *argv[])
{
    CommandLine line;
    try
    {
        line = ParseCommandLine(argc, argv);
    }
    catch (const InvalidOptionError &e)
    {
        LOG_ERROR(e.what());
        PrintUsage(std::cout);
        return EXIT_FAILURE;
    }

    if (line.help || line.command.empty())
    {
        PrintUsage(std::cout);
        return line.help ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    try
    {
        fs::path dir = fs::absolute(line.work_dir);
        const std::vector<std::string> &args = line.args;
        if (line.command == "neb-sort")
        {
            SortEndpoints(fs::absolute(Argument(args, 0, "ini POSCAR"), dir), fs::absolute(Argument(args, 1, "fni POSCAR"), dir));
        }
        else if (line.command == "neb-monitor")
        {
            PrintMonitor(Monitor(dir), std::cout);
        }
        else if (line.command == "movie")
        {
            TaskMovie(ParseTaskType(Argument(args, 0, "task")), dir, line.movie_name, line.freq);
        }
        else if (line.command == "sequence")
        {
            SequentialTaskChainer chainer(Config::Load(dir), line.flags);
            chainer.Generate(Argument(args, 0, "stage"));
        }
        else
        {
            TaskType type = ParseTaskType(line.command);
            VaspTask task(Config::Load(dir), type, line.flags);
            task.Generate();
        }
    }
    catch (const std::exception &e)
    {
        LOG_ERROR(e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
