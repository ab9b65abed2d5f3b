#pragma once

#include <string>
#include <vector>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

// Looks up override templates along an explicit, ordered list of directories
class TemplateResolver
{
public:
    explicit TemplateResolver(const std::vector<fs::path> &search_path) : search_path_(search_path) {}

    // dir, its parent, ..., filesystem root
    static std::vector<fs::path> AncestorChain(const fs::path &dir);

    // First regular file whose name ends with suffix; unreadable directories are skipped.
    fs::path Resolve(const std::string &suffix, const fs::path &fallback) const;

    const std::vector<fs::path> &search_path() const { return search_path_; }

private:
    std::vector<fs::path> search_path_;
};
