#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "task.h"

namespace fs = boost::filesystem;

// vaspflow <command> [args] [options]
struct CommandLine
{
    std::string command;
    std::vector<std::string> args;
    fs::path work_dir = ".";
    std::string movie_name;
    std::string freq = "image"; // Freq movie: image, all or a mode number
    TaskFlags flags;
    bool help = false;
};

// throws InvalidOptionError for unknown, malformed or conflicting options
CommandLine ParseCommandLine(int argc, const char *const argv[]);

void PrintUsage(std::ostream &out);
