#pragma once

#include <map>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include "incar.h"
#include "vasp_tool.h"

namespace fs = boost::filesystem;

#define FRAGMENT_HEADER "header"
#define FRAGMENT_ENVIRONMENT "environment"
#define FRAGMENT_RUN "run"
#define FRAGMENT_CHECK_OPT "check_opt"
#define FRAGMENT_CHECK_SCF "check_scf"
#define FRAGMENT_FINISH "finish"
#define FRAGMENT_ANALYSIS "analysis"

// Named shell fragments read from submit.yaml
class SchedulerTemplate
{
public:
    static SchedulerTemplate Load(const fs::path &path);

    void Add(const std::string &name, const std::string &body) { fragments_[name] = body; }
    bool Has(const std::string &name) const { return fragments_.count(name) > 0; }

    // throws FormatError for an unknown fragment
    const std::string &Body(const std::string &name) const;

private:
    std::map<std::string, std::string> fragments_;
};

// value none deletes the key
struct IncarEdit
{
    std::string key;
    boost::optional<IncarValue> value;
};

// Ordered edits to an INCAR that does not exist yet when the script is written
class IncarPatch
{
public:
    template <typename T>
    IncarPatch &Set(const std::string &key, const T &value)
    {
        edits_.push_back({ToUpper(key), IncarValue(value)});
        return *this;
    }

    IncarPatch &Set(const std::string &key, const char *value)
    {
        edits_.push_back({ToUpper(key), IncarValue(std::string(value))});
        return *this;
    }

    IncarPatch &Delete(const std::string &key)
    {
        edits_.push_back({ToUpper(key), boost::none});
        return *this;
    }

    const std::vector<IncarEdit> &edits() const { return edits_; }

    // what the rendered sed/echo lines do to the file
    void ApplyTo(Incar &incar) const;

private:
    std::vector<IncarEdit> edits_;
};

class SubmitScript
{
public:
    enum class ItemKind
    {
        Fragment,
        Comment,
        Command,
        ChangeDir,
        Edit,
        File
    };

    struct Item
    {
        ItemKind kind;
        std::string text;   // fragment name, comment, command, directory or file content
        std::string target; // edited / written file
        IncarPatch patch;
    };

    SubmitScript &AddFragment(const std::string &name);
    SubmitScript &AddComment(const std::string &text);
    SubmitScript &AddCommand(const std::string &command);
    SubmitScript &ChangeDir(const std::string &dir);
    SubmitScript &EditIncar(const std::string &file, const IncarPatch &patch);
    SubmitScript &AddFile(const std::string &file, const std::string &content);

    // Drops the terminal finish fragment; throws if the script does not end with one
    void RemoveTerminal();

    std::size_t CountFragment(const std::string &name) const;
    std::vector<std::string> Fragments() const;
    const std::vector<Item> &items() const { return items_; }

    std::string Render(const SchedulerTemplate &scheduler) const;
    void Write(const fs::path &path, const SchedulerTemplate &scheduler) const;

private:
    std::vector<Item> items_;
};
