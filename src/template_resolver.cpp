#include "template_resolver.h"
#include "logger.h"
#include "vasp_tool.h"

#include <algorithm>

std::vector<fs::path> TemplateResolver::AncestorChain(const fs::path &dir)
{
    std::vector<fs::path> chain;
    for (fs::path current = fs::weakly_canonical(fs::absolute(dir)); !current.empty(); current = current.parent_path())
    {
        chain.push_back(current);
        if (current == current.root_path())
        {
            break;
        }
    }
    return chain;
}

fs::path TemplateResolver::Resolve(const std::string &suffix, const fs::path &fallback) const
{
    for (const auto &dir : search_path_)
    {
        boost::system::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec)
        {
            DEBUG_PRINT("Skipping " << dir.string() << ": " << ec.message());
            continue;
        }

        std::vector<fs::path> matches;
        for (fs::directory_iterator end; it != end; it.increment(ec))
        {
            if (ec)
            {
                DEBUG_PRINT("Skipping rest of " << dir.string() << ": " << ec.message());
                break;
            }
            boost::system::error_code status_ec;
            if (fs::is_regular_file(it->path(), status_ec) && EndsWith(it->path().filename().string(), suffix))
            {
                matches.push_back(it->path());
            }
        }
        if (!matches.empty())
        {
            std::sort(matches.begin(), matches.end());
            DEBUG_PRINT("Template *" << suffix << " -> " << matches.front().string());
            return matches.front();
        }
    }
    return fallback;
}
