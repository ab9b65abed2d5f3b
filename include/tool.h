#pragma once

#include <string>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

// create-if-absent, parents included
void MakeDirectory(const fs::path &dir);

void CopyFile(const fs::path &source_file, const fs::path &destination_file);

void RunCommand(const std::string &command);

// Quote a string for /bin/sh
std::string ShellQuote(const std::string &text);
