#include "diskmv_remove.hpp"
#include "diskmv_io.hpp"
#include "diskmv_log.hpp"

#include <cerrno>
#include <cstring>

#include <sys/stat.h>
#include <unistd.h>

// Same object, and for non-directories the same content as when it was copied.
static bool diskmv_source_unchanged(const struct stat& then, const struct stat& now, bool is_dir) noexcept {
    if (then.st_dev != now.st_dev || then.st_ino != now.st_ino) return false;
    if (is_dir) return true;

    return then.st_size == now.st_size &&
           then.st_mtim.tv_sec == now.st_mtim.tv_sec &&
           then.st_mtim.tv_nsec == now.st_mtim.tv_nsec;
}

bool PosixObjectRemover::remove(const CandidateEntry& entry, std::string& err) {
    const char* path = entry.src_path.c_str();
    bool is_dir = entry.type == EntryType::Directory;

    struct stat now{};
    if (lstat(path, &now) != 0) {
        if (errno == ENOENT) {
            DISKMV_LOG_DEBUG("remove", "Source already gone: %s", path);
            return true;
        }
        err = std::string("cannot examine source: ") + strerror(errno);
        return false;
    }

    if (!diskmv_source_unchanged(entry.src_st, now, is_dir)) {
        err = "source changed after copy; left in place";
        return false;
    }

    if (cfg_.fsync_before_delete) {
        std::string dst_parent = diskmv_parent_path(entry.dst_path);
        if (!dst_parent.empty() && diskmv_fsync_dir(dst_parent) != 0) {
            err = "cannot sync destination directory " + dst_parent + ": " + strerror(errno);
            return false;
        }
    }

    if (is_dir) {
        if (rmdir(path) != 0) {
            err = std::string("cannot remove directory: ") + strerror(errno);
            return false;
        }
    } else if (unlink(path) != 0) {
        err = std::string("cannot remove source: ") + strerror(errno);
        return false;
    }

    DISKMV_LOG_DEBUG("remove", "Removed %s", path);
    return true;
}
