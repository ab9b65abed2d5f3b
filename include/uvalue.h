#pragma once

#include <map>
#include <string>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

// orbital -1 switches the correction off for the element
struct UValueEntry
{
    int orbital = -1;
    double u = 0.0;
    double j = 0.0;
};

// Per-element DFT+U table, YAML keys of the form "Element Fe"
class UValueTable
{
public:
    static UValueTable Load(const fs::path &path);

    void Add(const std::string &element, const UValueEntry &entry) { entries_[element] = entry; }

    // false when the element has no entry
    bool Lookup(const std::string &element, UValueEntry &entry) const;

    std::size_t size() const { return entries_.size(); }

private:
    std::map<std::string, UValueEntry> entries_;
};
