#include "config.h"
#include "errors.h"
#include "logger.h"
#include "template_resolver.h"
#include "vasp_tool.h"

#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace
{

fs::path ResolveAgainst(const fs::path &base, const std::string &value)
{
    fs::path path(value);
    return path.is_absolute() ? path : base / path;
}

} // namespace

fs::path Config::DefaultDir()
{
    const char *home = std::getenv("VASPFLOW_HOME");
    if (home != nullptr && *home != '\0')
    {
        return fs::path(home);
    }
    const char *user_home = std::getenv("HOME");
    if (user_home == nullptr)
    {
        throw std::runtime_error("Neither VASPFLOW_HOME nor HOME is set");
    }
    return fs::path(user_home) / ".vaspflow";
}

Config Config::Load(const fs::path &work_dir)
{
    return Load(work_dir, DefaultDir());
}

Config Config::Load(const fs::path &work_dir, const fs::path &default_dir)
{
    Config config;
    config.work_dir = fs::absolute(work_dir);
    config.search_path = TemplateResolver::AncestorChain(config.work_dir);

    fs::path default_incar = default_dir / INCAR;
    fs::path default_uvalue = default_dir / "UValue.yaml";
    fs::path default_submit = default_dir / "submit.yaml";
    config.pot_dir = default_dir / "potentials";

    fs::path config_file = default_dir / CONFIG_FILE;
    if (fs::exists(config_file))
    {
        YAML::Node root;
        try
        {
            root = YAML::LoadFile(config_file.string());
        }
        catch (const YAML::Exception &ex)
        {
            throw FormatError("Bad " + config_file.string() + ": " + ex.what());
        }
        if (root["INCAR"])
        {
            default_incar = ResolveAgainst(default_dir, root["INCAR"].as<std::string>());
        }
        if (root["UValue"])
        {
            default_uvalue = ResolveAgainst(default_dir, root["UValue"].as<std::string>());
        }
        if (root["submit"])
        {
            default_submit = ResolveAgainst(default_dir, root["submit"].as<std::string>());
        }
        if (root["potdir"])
        {
            config.pot_dir = ResolveAgainst(default_dir, root["potdir"].as<std::string>());
        }
        config.potential = root["potential"].as<std::string>(config.potential);
        config.overlap_distance = root["overlap_distance"].as<double>(config.overlap_distance);
        config.idpp_command = root["idpp"].as<std::string>(config.idpp_command);
        config.vaspkit_command = root["vaspkit"].as<std::string>(config.vaspkit_command);
    }
    else
    {
        DEBUG_PRINT("No " << config_file.string() << ", using built-in defaults");
    }

    TemplateResolver resolver(config.search_path);
    config.incar_template = resolver.Resolve(INCAR_SUFFIX, default_incar);
    config.uvalue_file = resolver.Resolve(UVALUE_SUFFIX, default_uvalue);
    config.submit_template = resolver.Resolve(SUBMIT_SUFFIX, default_submit);

    DEBUG_PRINT("INCAR template: " << config.incar_template.string());
    DEBUG_PRINT("UValue table: " << config.uvalue_file.string());
    DEBUG_PRINT("submit template: " << config.submit_template.string());
    return config;
}
