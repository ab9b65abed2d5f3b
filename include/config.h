#pragma once

#include <string>
#include <vector>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

#define CONFIG_FILE "config.yaml"

// Per-invocation settings: resolved templates plus the process-wide defaults
struct Config
{
    fs::path work_dir;
    std::vector<fs::path> search_path; // work_dir first, then its ancestors

    fs::path incar_template;
    fs::path uvalue_file;
    fs::path submit_template;

    fs::path pot_dir;
    std::string potential = "PAW_PBE";
    double overlap_distance = 0.5;
    std::string idpp_command;
    std::string vaspkit_command = "vaspkit";

    // $VASPFLOW_HOME, else $HOME/.vaspflow
    static fs::path DefaultDir();

    static Config Load(const fs::path &work_dir);
    static Config Load(const fs::path &work_dir, const fs::path &default_dir);
};
