#include "submit_script.h"
#include "errors.h"
#include "tool.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

////////////////////////// SchedulerTemplate //////////////////////////

SchedulerTemplate SchedulerTemplate::Load(const fs::path &path)
{
    if (!fs::exists(path))
    {
        throw InputMissingError("Scheduler template not found: " + path.string());
    }

    SchedulerTemplate scheduler;
    try
    {
        YAML::Node root = YAML::LoadFile(path.string());
        for (const auto &item : root)
        {
            scheduler.fragments_[item.first.as<std::string>()] = item.second.as<std::string>();
        }
    }
    catch (const YAML::Exception &ex)
    {
        throw FormatError("Bad scheduler template " + path.string() + ": " + ex.what());
    }
    return scheduler;
}

const std::string &SchedulerTemplate::Body(const std::string &name) const
{
    auto it = fragments_.find(name);
    if (it == fragments_.end())
    {
        throw FormatError("Scheduler template has no '" + name + "' fragment");
    }
    return it->second;
}

////////////////////////// IncarPatch //////////////////////////

void IncarPatch::ApplyTo(Incar &incar) const
{
    for (const auto &edit : edits_)
    {
        incar.Delete(edit.key);
        if (edit.value)
        {
            incar.Set(edit.key, *edit.value);
        }
    }
}

////////////////////////// SubmitScript //////////////////////////

SubmitScript &SubmitScript::AddFragment(const std::string &name)
{
    items_.push_back({ItemKind::Fragment, name, "", IncarPatch()});
    return *this;
}

SubmitScript &SubmitScript::AddComment(const std::string &text)
{
    items_.push_back({ItemKind::Comment, text, "", IncarPatch()});
    return *this;
}

SubmitScript &SubmitScript::AddCommand(const std::string &command)
{
    items_.push_back({ItemKind::Command, command, "", IncarPatch()});
    return *this;
}

SubmitScript &SubmitScript::ChangeDir(const std::string &dir)
{
    items_.push_back({ItemKind::ChangeDir, dir, "", IncarPatch()});
    return *this;
}

SubmitScript &SubmitScript::EditIncar(const std::string &file, const IncarPatch &patch)
{
    items_.push_back({ItemKind::Edit, "", file, patch});
    return *this;
}

SubmitScript &SubmitScript::AddFile(const std::string &file, const std::string &content)
{
    items_.push_back({ItemKind::File, content, file, IncarPatch()});
    return *this;
}

void SubmitScript::RemoveTerminal()
{
    auto last = std::find_if(items_.rbegin(), items_.rend(), [](const Item &item)
                             { return item.kind == ItemKind::Fragment; });
    if (last == items_.rend() || last->text != FRAGMENT_FINISH)
    {
        throw std::runtime_error("Submit script does not end with a finish fragment");
    }
    items_.erase(std::next(last).base());
}

std::size_t SubmitScript::CountFragment(const std::string &name) const
{
    return std::count_if(items_.begin(), items_.end(), [&name](const Item &item)
                         { return item.kind == ItemKind::Fragment && item.text == name; });
}

std::vector<std::string> SubmitScript::Fragments() const
{
    std::vector<std::string> names;
    for (const auto &item : items_)
    {
        if (item.kind == ItemKind::Fragment)
        {
            names.push_back(item.text);
        }
    }
    return names;
}

std::string SubmitScript::Render(const SchedulerTemplate &scheduler) const
{
    std::ostringstream oss;
    for (const auto &item : items_)
    {
        switch (item.kind)
        {
        case ItemKind::Fragment:
        {
            const std::string &body = scheduler.Body(item.text);
            oss << body;
            if (!body.empty() && body.back() != '\n')
            {
                oss << "\n";
            }
            break;
        }
        case ItemKind::Comment:
            oss << "\n# " << item.text << "\n";
            break;
        case ItemKind::Command:
            oss << item.text << "\n";
            break;
        case ItemKind::ChangeDir:
            oss << "cd " << ShellQuote(item.text) << "\n";
            break;
        case ItemKind::Edit:
            for (const auto &edit : item.patch.edits())
            {
                oss << "sed -i " << ShellQuote("/^\\s*" + edit.key + "\\s*=/d") << " " << ShellQuote(item.target) << "\n";
                if (edit.value)
                {
                    oss << "echo \"" << edit.key << " = " << Incar::FormatValue(*edit.value) << "\" >> "
                        << ShellQuote(item.target) << "\n";
                }
            }
            break;
        case ItemKind::File:
            oss << "cat > " << ShellQuote(item.target) << " << 'EOF'\n"
                << item.text;
            if (!item.text.empty() && item.text.back() != '\n')
            {
                oss << "\n";
            }
            oss << "EOF\n";
            break;
        }
    }
    return oss.str();
}

void SubmitScript::Write(const fs::path &path, const SchedulerTemplate &scheduler) const
{
    std::ofstream outfile(path.string());
    if (!outfile.is_open())
    {
        throw std::runtime_error("Cannot write file: " + path.string());
    }
    outfile << Render(scheduler);
}
