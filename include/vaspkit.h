#pragma once

#include <csignal>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/filesystem.hpp>
#include "kpoints.h"
#include "logger.h"
#include "tool.h"

namespace fs = boost::filesystem;

struct PcloseDeleter {
    void operator()(FILE* ptr) const {
        if (ptr) {
            pclose(ptr);
        }
    }
};

// Drives an interactive vaspkit process through its stdin
class VaspkitManager {
public:
    explicit VaspkitManager(const std::string &command = "vaspkit") : command_(command) {}

    ~VaspkitManager() {
        vaspkitPipe.reset();
        restoreSigpipe();
    }

    VaspkitManager(const VaspkitManager&) = delete;
    VaspkitManager& operator=(const VaspkitManager&) = delete;

    void startVaspkit(const fs::path &work_dir, const std::string &log_mark = "") {
        if (vaspkitPipe) {
            throw std::runtime_error("VASPKIT is already running.");
        }
        output_filename = (work_dir / ("vaspkit_output_" + log_mark + ".log")).string();
        std::string command = "cd " + ShellQuote(work_dir.string()) + " && " + command_ + " > " + ShellQuote(output_filename) + " 2>&1";
        DEBUG_PRINT("Starting: " << command);
        // a vaspkit that exits early must not kill us on the next write
        previousSigpipe = std::signal(SIGPIPE, SIG_IGN);
        sigpipeIgnored = true;
        vaspkitPipe = std::unique_ptr<FILE, PcloseDeleter>(popen(command.c_str(), "w"));
        if (!vaspkitPipe) {
            restoreSigpipe();
            throw std::runtime_error("Failed to start VASPKIT process: " + command_);
        }
    }

    // waits for vaspkit to exit and reports a non-zero status
    void stopVaspkit() {
        if (vaspkitPipe) {
            int status = pclose(vaspkitPipe.release());
            restoreSigpipe();
            if (status != 0) {
                throw std::runtime_error("VASPKIT exited with status " + std::to_string(status) + ", see " + output_filename);
            }
        }
    }

    void sendInputToVaspkit(const std::string& input) {
        if (!vaspkitPipe) {
            throw std::runtime_error("VASPKIT process is not running.");
        }
        if (fputs(input.c_str(), vaspkitPipe.get()) == EOF || fflush(vaspkitPipe.get()) == EOF) {
            throw std::runtime_error("VASPKIT stopped reading input, see " + output_filename);
        }
    }

    const std::string& getOutputFilename() const {
        return output_filename;
    }

private:
    void restoreSigpipe() {
        if (sigpipeIgnored) {
            std::signal(SIGPIPE, previousSigpipe);
            sigpipeIgnored = false;
        }
    }

    std::string command_;
    std::string output_filename;
    std::unique_ptr<FILE, PcloseDeleter> vaspkitPipe;
    void (*previousSigpipe)(int) = SIG_DFL;
    bool sigpipeIgnored = false;
};

// High-symmetry path from vaspkit task 303 (writes KPATH.in next to POSCAR)
class VaspkitKPathProvider : public KPathProvider
{
public:
    explicit VaspkitKPathProvider(const std::string &command) : command_(command) {}

    std::vector<KPathSegment> FindPath(const fs::path &work_dir) override;

private:
    std::string command_;
};
