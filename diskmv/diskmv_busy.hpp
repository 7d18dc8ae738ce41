#pragma once

#include <string>

#include <sys/stat.h>

// -----------------------------------------------------------------------------
// "Is this file open elsewhere" check
// -----------------------------------------------------------------------------
//
// Best effort only: a process may open the file right after the check and
// before the copy starts.
class BusyProbe {
public:
    virtual ~BusyProbe() = default;

    // True when a process other than this one holds the file open or mapped.
    virtual bool is_open_elsewhere(const std::string& path, const struct stat& st) = 0;
};

// Scans /proc/<pid>/fd and /proc/<pid>/maps of every process. Processes this
// user may not inspect are skipped (a warning is logged once).
class ProcFdBusyProbe : public BusyProbe {
public:
    explicit ProcFdBusyProbe(std::string proc_root = "/proc");

    bool is_open_elsewhere(const std::string& path, const struct stat& st) override;

private:
    bool process_holds(const std::string& pid_dir, const struct stat& st);

    std::string proc_root_;
    bool warned_ = false;
};
