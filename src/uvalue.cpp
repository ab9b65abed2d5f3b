#include "uvalue.h"
#include "errors.h"
#include "vasp_tool.h"

#include <yaml-cpp/yaml.h>

UValueTable UValueTable::Load(const fs::path &path)
{
    UValueTable table;
    if (!fs::exists(path))
    {
        throw InputMissingError("U-value table not found: " + path.string());
    }

    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path.string());
    }
    catch (const YAML::Exception &ex)
    {
        throw FormatError("Bad U-value table " + path.string() + ": " + ex.what());
    }

    for (const auto &item : root)
    {
        // Element Fe: {orbital: 2, U: 4.0, J: 0.0}
        std::vector<std::string> tokens = SplitWhitespace(item.first.as<std::string>());
        if (tokens.size() != 2 || tokens[0] != "Element")
        {
            continue;
        }
        const YAML::Node &node = item.second;
        UValueEntry entry;
        try
        {
            entry.orbital = node["orbital"].as<int>(-1);
            entry.u = node["U"].as<double>(0.0);
            entry.j = node["J"].as<double>(0.0);
        }
        catch (const YAML::Exception &ex)
        {
            throw FormatError("Bad U-value entry for " + tokens[1] + " in " + path.string() + ": " + ex.what());
        }
        table.entries_[tokens[1]] = entry;
    }
    return table;
}

bool UValueTable::Lookup(const std::string &element, UValueEntry &entry) const
{
    auto it = entries_.find(element);
    if (it == entries_.end())
    {
        return false;
    }
    entry = it->second;
    return true;
}
