#include "diskmv_busy.hpp"
#include "diskmv_io.hpp"
#include "diskmv_log.hpp"

#include <cctype>
#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <vector>

#include <sys/sysmacros.h>
#include <unistd.h>

ProcFdBusyProbe::ProcFdBusyProbe(std::string proc_root) : proc_root_(std::move(proc_root)) {}

static bool diskmv_is_pid_name(const char* name) noexcept {
    if (!*name) return false;
    for (const char* p = name; *p; ++p) {
        if (!isdigit(static_cast<unsigned char>(*p))) return false;
    }
    return true;
}

bool ProcFdBusyProbe::process_holds(const std::string& pid_dir, const struct stat& st) {
    std::string fd_dir = pid_dir + "/fd";
    std::vector<std::string> fds;

    if (diskmv_list_dir(fd_dir, fds)) {
        for (const auto& fd : fds) {
            struct stat target{};
            std::string link = fd_dir + "/" + fd;
            if (stat(link.c_str(), &target) != 0) continue;
            if (target.st_dev == st.st_dev && target.st_ino == st.st_ino) {
                DISKMV_LOG_DEBUG("busy", "%s holds the file open (fd %s)", pid_dir.c_str(), fd.c_str());
                return true;
            }
        }
    } else if (errno == EACCES || errno == EPERM) {
        if (!warned_) {
            warned_ = true;
            DISKMV_LOG_WARN("busy", "Cannot inspect open files of every process (%s); "
                            "the in-use check is incomplete without root", strerror(errno));
        }
        return false;
    }

    // Memory mappings keep a file in use without an open descriptor.
    std::string maps = pid_dir + "/maps";
    FILE* f = fopen(maps.c_str(), "re");
    if (!f) return false;

    bool found = false;
    char line[4096];
    while (fgets(line, sizeof(line), f)) {
        unsigned int dev_major = 0;
        unsigned int dev_minor = 0;
        uintmax_t inode = 0;
        if (sscanf(line, "%*s %*s %*s %x:%x %" SCNuMAX, &dev_major, &dev_minor, &inode) != 3) continue;
        if (inode == 0) continue;
        if (inode == static_cast<uintmax_t>(st.st_ino) &&
            dev_major == major(st.st_dev) && dev_minor == minor(st.st_dev)) {
            DISKMV_LOG_DEBUG("busy", "%s maps the file", pid_dir.c_str());
            found = true;
            break;
        }
    }
    fclose(f);
    return found;
}

bool ProcFdBusyProbe::is_open_elsewhere(const std::string& path, const struct stat& st) {
    unique_dir proc(opendir(proc_root_.c_str()));
    if (!proc) {
        DISKMV_LOG_WARN("busy", "Cannot open %s: %s; treating %s as not in use",
                        proc_root_.c_str(), strerror(errno), path.c_str());
        return false;
    }

    const std::string self = std::to_string(getpid());

    struct dirent* de;
    while ((de = readdir(proc.get())) != nullptr) {
        if (!diskmv_is_pid_name(de->d_name)) continue;
        if (self == de->d_name) continue;

        if (process_holds(proc_root_ + "/" + de->d_name, st)) {
            return true;
        }
    }

    return false;
}
