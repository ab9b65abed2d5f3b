#include "tool.h"
#include "logger.h"

#include <cstdlib>
#include <stdexcept>

void MakeDirectory(const fs::path &dir)
{
    if (!fs::is_directory(dir))
    {
        DEBUG_PRINT("Creating directory: " << dir.string());
        fs::create_directories(dir);
    }
}

void CopyFile(const fs::path &source_file, const fs::path &destination_file)
{
    if (!fs::is_regular_file(source_file))
    {
        throw std::runtime_error("File " + source_file.string() + " does not exist or is not a regular file.");
    }
    if (destination_file.has_parent_path())
    {
        MakeDirectory(destination_file.parent_path());
    }
    fs::copy_file(source_file, destination_file, fs::copy_options::overwrite_existing);
}

void RunCommand(const std::string &command)
{
    DEBUG_PRINT("Running: " << command);
    int result = std::system(command.c_str());
    if (result != 0)
    {
        LOG_ERROR("Command failed -> " << command);
        throw std::runtime_error("Command failed: " + command);
    }
}

std::string ShellQuote(const std::string &text)
{
    std::string quoted = "'";
    for (char c : text)
    {
        if (c == '\'')
        {
            quoted += "'\\''";
        }
        else
        {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}
