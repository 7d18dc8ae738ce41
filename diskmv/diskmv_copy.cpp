#include "diskmv_copy.hpp"
#include "diskmv_io.hpp"
#include "diskmv_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <climits>
#include <cstring>
#include <limits>
#include <new>
#include <set>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/syscall.h>
#include <sys/xattr.h>
#include <unistd.h>

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

// -----------------------------------------------------------------------------
// Data copy: copy_file_range with a read/write fallback
// -----------------------------------------------------------------------------
bool diskmv_copy_fd(int src_fd, int dst_fd, uint64_t file_size, const Config& cfg) noexcept {
    if (file_size == 0) return true;

#ifdef SYS_copy_file_range
    if (cfg.use_copy_file_range) {
        loff_t offset = 0;

        while (static_cast<uint64_t>(offset) < file_size) {
            size_t to_copy = std::min<uint64_t>(file_size - offset, 1ULL << 30);

            ssize_t n = syscall(SYS_copy_file_range,
                                src_fd, &offset,
                                dst_fd, nullptr,
                                to_copy, 0);
            if (n > 0) continue;

            if (n == 0 || errno == EXDEV || errno == EINVAL || errno == ENOSYS || errno == EOPNOTSUPP) {
                DISKMV_LOG_DEBUG("copy", "copy_file_range stopped at %" PRIu64 " bytes, falling back",
                                 static_cast<uint64_t>(offset));
                break;
            }

            if (errno == EINTR) continue;

            DISKMV_LOG_WARN("copy", "copy_file_range failed: %s", strerror(errno));
            return false;
        }

        if (static_cast<uint64_t>(offset) >= file_size) {
            return true;
        }
    }
#endif

    std::vector<char> buffer;
    try {
        buffer.resize(cfg.copy_chunk_kb * constants::KIB);
    } catch (const std::bad_alloc&) {
        errno = ENOMEM;
        return false;
    }

    if (lseek(src_fd, 0, SEEK_SET) == static_cast<off_t>(-1) ||
        lseek(dst_fd, 0, SEEK_SET) == static_cast<off_t>(-1)) {
        DISKMV_LOG_ERROR("copy", "lseek failed in fallback copy: %s", strerror(errno));
        return false;
    }

    uint64_t remaining = file_size;
    while (remaining > 0) {
        size_t toread = std::min<uint64_t>(buffer.size(), remaining);
        ssize_t r = diskmv_safe_read(src_fd, buffer.data(), toread);

        if (r < 0) {
            DISKMV_LOG_ERROR("copy", "read failed during copy: %s", strerror(errno));
            return false;
        } else if (r == 0) {
            DISKMV_LOG_ERROR("copy", "Unexpected EOF during copy: expected %" PRIu64 ", got %" PRIu64 " bytes",
                             file_size, file_size - remaining);
            errno = EIO;
            return false;
        }

        ssize_t w = diskmv_safe_write(dst_fd, buffer.data(), static_cast<size_t>(r));
        if (w != r) {
            DISKMV_LOG_ERROR("copy", "write failed during copy: wrote %zd/%zd bytes: %s",
                             w, r, strerror(errno));
            return false;
        }

        remaining -= static_cast<uint64_t>(r);
    }

    return true;
}

// -----------------------------------------------------------------------------
// Disk space checks
// -----------------------------------------------------------------------------
bool diskmv_check_destination_space(const std::string& dir,
                                    uint64_t needed,
                                    uint64_t reclaimable,
                                    const Config& cfg) noexcept {
    uint64_t reserve = cfg.reserve_bytes();
    if (needed > std::numeric_limits<uint64_t>::max() - reserve) {
        DISKMV_LOG_ERROR("copy", "File size too large for safe calculation: %" PRIu64, needed);
        return false;
    }
    uint64_t need = needed + reserve;

    struct statvfs sv{};
    if (statvfs(dir.c_str(), &sv) != 0) {
        DISKMV_LOG_WARN("copy", "statvfs failed for %s: %s", dir.c_str(), strerror(errno));
        return true;
    }

    uint64_t avail = static_cast<uint64_t>(sv.f_bavail) * sv.f_frsize;
    if (avail > std::numeric_limits<uint64_t>::max() - reclaimable) {
        return true;
    }
    avail += reclaimable;

    if (avail < need) {
        DISKMV_LOG_WARN("copy", "Not enough space on %s: need=%" PRIu64 " avail=%" PRIu64,
                        dir.c_str(), need, avail);
        return false;
    }

    DISKMV_LOG_DEBUG("copy", "Space check OK: %s (%" PRIu64 " avail, %" PRIu64 " needed)",
                     dir.c_str(), avail, need);
    return true;
}

// -----------------------------------------------------------------------------
// Extended attributes and ACLs
// -----------------------------------------------------------------------------
bool diskmv_xattr_is_required(const char* name) noexcept {
    return strncmp(name, "user.", 5) == 0 ||
           strcmp(name, "system.posix_acl_access") == 0 ||
           strcmp(name, "system.posix_acl_default") == 0;
}

// Names of the attributes on fd. A filesystem without xattr support yields an
// empty list.
static bool diskmv_list_xattrs(int fd, std::vector<std::string>& names) {
    names.clear();

    std::vector<char> buf;
    for (int attempt = 0; attempt < 3; ++attempt) {
        ssize_t len = flistxattr(fd, nullptr, 0);
        if (len < 0) {
            return errno == ENOTSUP;
        }
        if (len == 0) return true;

        buf.resize(static_cast<size_t>(len));
        len = flistxattr(fd, buf.data(), buf.size());
        if (len < 0) {
            if (errno == ERANGE) continue;
            return false;
        }

        for (ssize_t pos = 0; pos < len; ) {
            const char* name = buf.data() + pos;
            size_t n = strnlen(name, static_cast<size_t>(len - pos));
            if (n > 0) names.emplace_back(name, n);
            pos += static_cast<ssize_t>(n) + 1;
        }
        return true;
    }

    errno = ERANGE;
    return false;
}

static bool diskmv_copy_xattrs(int src_fd, int dst_fd, std::string& err) {
    std::vector<std::string> names;
    if (!diskmv_list_xattrs(src_fd, names)) {
        err = std::string("cannot list extended attributes: ") + strerror(errno);
        return false;
    }

    for (const auto& name : names) {
        bool required = diskmv_xattr_is_required(name.c_str());

        ssize_t vlen = fgetxattr(src_fd, name.c_str(), nullptr, 0);
        std::vector<char> value;
        if (vlen > 0) {
            value.resize(static_cast<size_t>(vlen));
            vlen = fgetxattr(src_fd, name.c_str(), value.data(), value.size());
        }
        if (vlen < 0) {
            if (required) {
                err = "cannot read extended attribute " + name + ": " + strerror(errno);
                return false;
            }
            DISKMV_LOG_DEBUG("copy", "Skipping unreadable attribute %s: %s", name.c_str(), strerror(errno));
            continue;
        }

        if (fsetxattr(dst_fd, name.c_str(), value.data(), static_cast<size_t>(vlen), 0) != 0) {
            if (required) {
                err = "cannot set extended attribute " + name + ": " + strerror(errno);
                return false;
            }
            DISKMV_LOG_WARN("copy", "Attribute %s not preserved: %s", name.c_str(), strerror(errno));
        }
    }

    // An overwritten destination must not keep attributes the source lacks.
    std::vector<std::string> existing;
    if (!diskmv_list_xattrs(dst_fd, existing)) {
        return true;
    }
    std::set<std::string> wanted(names.begin(), names.end());
    for (const auto& name : existing) {
        if (!diskmv_xattr_is_required(name.c_str()) || wanted.count(name) != 0) continue;
        if (fremovexattr(dst_fd, name.c_str()) != 0 && errno != ENODATA) {
            err = "cannot remove stale extended attribute " + name + ": " + strerror(errno);
            return false;
        }
    }

    return true;
}

// Symlinks cannot carry user.* attributes on Linux, so everything here is
// best effort.
static void diskmv_copy_link_xattrs(const std::string& src, const std::string& dst) {
    ssize_t len = llistxattr(src.c_str(), nullptr, 0);
    if (len <= 0) return;

    std::vector<char> buf(static_cast<size_t>(len));
    len = llistxattr(src.c_str(), buf.data(), buf.size());
    if (len <= 0) return;

    for (ssize_t pos = 0; pos < len; ) {
        const char* name = buf.data() + pos;
        size_t n = strnlen(name, static_cast<size_t>(len - pos));
        pos += static_cast<ssize_t>(n) + 1;
        if (n == 0) continue;

        char value[4096];
        ssize_t vlen = lgetxattr(src.c_str(), name, value, sizeof(value));
        if (vlen < 0 || lsetxattr(dst.c_str(), name, value, static_cast<size_t>(vlen), 0) != 0) {
            DISKMV_LOG_DEBUG("copy", "Link attribute %s not preserved on %s: %s",
                             name, dst.c_str(), strerror(errno));
        }
    }
}

// Owner first (chown clears set-id bits), then mode, then ACLs and other
// attributes, times last.
static bool diskmv_apply_metadata(int src_fd, int dst_fd, const struct stat& st, std::string& err) {
    if (fchown(dst_fd, st.st_uid, st.st_gid) != 0) {
        err = "cannot set owner " + std::to_string(st.st_uid) + ":" + std::to_string(st.st_gid) +
              ": " + strerror(errno);
        return false;
    }

    if (fchmod(dst_fd, st.st_mode & 07777) != 0) {
        err = std::string("cannot set permissions: ") + strerror(errno);
        return false;
    }

    if (!diskmv_copy_xattrs(src_fd, dst_fd, err)) {
        return false;
    }

    const struct timespec times[2] = { st.st_atim, st.st_mtim };
    if (futimens(dst_fd, times) != 0) {
        err = std::string("cannot set timestamps: ") + strerror(errno);
        return false;
    }

    return true;
}

static bool diskmv_same_content_identity(const struct stat& a, const struct stat& b) noexcept {
    return a.st_dev == b.st_dev &&
           a.st_ino == b.st_ino &&
           a.st_size == b.st_size &&
           a.st_mtim.tv_sec == b.st_mtim.tv_sec &&
           a.st_mtim.tv_nsec == b.st_mtim.tv_nsec;
}

// -----------------------------------------------------------------------------
// PosixObjectCopier
// -----------------------------------------------------------------------------
bool PosixObjectCopier::make_parents(const CandidateEntry& entry,
                                     const Volume& src,
                                     const Volume& dst,
                                     std::string& err) {
    std::string parent_rel = diskmv_parent_path(entry.rel_path);
    if (parent_rel.empty()) return true;

    size_t pos = 0;
    while (pos <= parent_rel.size()) {
        size_t next = parent_rel.find('/', pos);
        if (next == std::string::npos) next = parent_rel.size();
        std::string prefix = parent_rel.substr(0, next);
        pos = next + 1;

        std::string dir = diskmv_join_path(dst.mount_point, prefix);
        struct stat st{};
        if (lstat(dir.c_str(), &st) == 0) {
            if (!S_ISDIR(st.st_mode)) {
                err = dir + " exists and is not a directory";
                return false;
            }
            continue;
        }
        if (errno != ENOENT) {
            err = "cannot examine " + dir + ": " + strerror(errno);
            return false;
        }

        // Implied directories take mode and owner from the source side. The
        // owner keeps write access until the directory itself is moved.
        struct stat src_st{};
        std::string src_dir = diskmv_join_path(src.mount_point, prefix);
        bool have_src = lstat(src_dir.c_str(), &src_st) == 0 && S_ISDIR(src_st.st_mode);
        mode_t mode = (have_src ? (src_st.st_mode & 07777) : 0755) | S_IRWXU;

        if (mkdir(dir.c_str(), mode) != 0 && errno != EEXIST) {
            err = "cannot create directory " + dir + ": " + strerror(errno);
            return false;
        }

        if (have_src) {
            if (lchown(dir.c_str(), src_st.st_uid, src_st.st_gid) != 0) {
                DISKMV_LOG_WARN("copy", "Cannot set owner of %s: %s", dir.c_str(), strerror(errno));
            }
            if (chmod(dir.c_str(), mode) != 0) {
                DISKMV_LOG_WARN("copy", "Cannot set permissions of %s: %s", dir.c_str(), strerror(errno));
            }
        }
        DISKMV_LOG_DEBUG("copy", "Created directory %s", dir.c_str());
    }

    return true;
}

bool PosixObjectCopier::copy_regular(const CandidateEntry& entry, std::string& err) {
    const struct stat& st = entry.src_st;
    const std::string& dst_path = entry.dst_path;

    unique_fd src_fd(open(entry.src_path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (!src_fd) {
        err = std::string("cannot open source: ") + strerror(errno);
        return false;
    }

    struct stat current{};
    if (fstat(src_fd.get(), &current) != 0) {
        err = std::string("cannot examine source: ") + strerror(errno);
        return false;
    }
    if (!diskmv_same_content_identity(current, st)) {
        err = "source changed since it was examined";
        return false;
    }

    uint64_t reclaimable = 0;
    bool created = true;
    struct stat dst_st{};
    if (lstat(dst_path.c_str(), &dst_st) == 0) {
        if (S_ISDIR(dst_st.st_mode)) {
            err = "destination is a directory";
            return false;
        }
        if (S_ISREG(dst_st.st_mode)) {
            reclaimable = static_cast<uint64_t>(dst_st.st_blocks) * 512;
            created = false;
        } else if (unlink(dst_path.c_str()) != 0) {
            err = std::string("cannot replace destination: ") + strerror(errno);
            return false;
        }
    }

    if (!diskmv_check_destination_space(diskmv_parent_path(dst_path),
                                        static_cast<uint64_t>(st.st_size), reclaimable, cfg_)) {
        err = "not enough free space on destination";
        return false;
    }

    unique_fd dst_fd(open(dst_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0600));
    if (!dst_fd) {
        err = std::string("cannot create destination: ") + strerror(errno);
        return false;
    }

    auto fail = [&](const std::string& why) {
        err = why;
        dst_fd.reset();
        if (created && unlink(dst_path.c_str()) != 0) {
            DISKMV_LOG_WARN("copy", "Cannot remove partial copy %s: %s", dst_path.c_str(), strerror(errno));
        }
        return false;
    };

    if (!diskmv_copy_fd(src_fd.get(), dst_fd.get(), static_cast<uint64_t>(st.st_size), cfg_)) {
        return fail(std::string("data copy failed: ") + strerror(errno));
    }

    std::string meta_err;
    if (!diskmv_apply_metadata(src_fd.get(), dst_fd.get(), st, meta_err)) {
        return fail(meta_err);
    }

    if (cfg_.fsync_before_delete && fsync(dst_fd.get()) != 0) {
        return fail(std::string("fsync failed: ") + strerror(errno));
    }

    struct stat written{};
    if (fstat(dst_fd.get(), &written) != 0 || written.st_size != st.st_size) {
        return fail("destination size does not match source");
    }

    if (fstat(src_fd.get(), &current) != 0 || !diskmv_same_content_identity(current, st)) {
        return fail("source modified during copy");
    }

    return true;
}

bool PosixObjectCopier::copy_directory(const CandidateEntry& entry, std::string& err) {
    const std::string& dst_path = entry.dst_path;

    struct stat dst_st{};
    bool create = false;
    if (lstat(dst_path.c_str(), &dst_st) == 0) {
        if (!S_ISDIR(dst_st.st_mode)) {
            if (unlink(dst_path.c_str()) != 0) {
                err = std::string("cannot replace destination: ") + strerror(errno);
                return false;
            }
            create = true;
        }
    } else if (errno == ENOENT) {
        create = true;
    } else {
        err = std::string("cannot examine destination: ") + strerror(errno);
        return false;
    }

    if (create && mkdir(dst_path.c_str(), 0700) != 0 && errno != EEXIST) {
        err = std::string("cannot create directory: ") + strerror(errno);
        return false;
    }

    unique_fd src_fd(open(entry.src_path.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC));
    if (!src_fd) {
        err = std::string("cannot open source directory: ") + strerror(errno);
        return false;
    }

    unique_fd dst_fd(open(dst_path.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC));
    if (!dst_fd) {
        err = std::string("cannot open destination directory: ") + strerror(errno);
        return false;
    }

    if (!diskmv_apply_metadata(src_fd.get(), dst_fd.get(), entry.src_st, err)) {
        return false;
    }

    if (cfg_.fsync_before_delete && fsync(dst_fd.get()) != 0) {
        DISKMV_LOG_WARN("copy", "fsync directory failed %s: %s", dst_path.c_str(), strerror(errno));
    }

    return true;
}

bool PosixObjectCopier::copy_symlink(const CandidateEntry& entry, std::string& err) {
    const struct stat& st = entry.src_st;
    const std::string& dst_path = entry.dst_path;

    size_t cap = st.st_size > 0 ? static_cast<size_t>(st.st_size) + 1 : PATH_MAX;
    std::vector<char> target(cap);
    ssize_t len = readlink(entry.src_path.c_str(), target.data(), target.size());
    if (len < 0) {
        err = std::string("cannot read link: ") + strerror(errno);
        return false;
    }
    if (static_cast<size_t>(len) >= target.size()) {
        err = "link target changed while reading it";
        return false;
    }
    std::string link_target(target.data(), static_cast<size_t>(len));

    struct stat dst_st{};
    if (lstat(dst_path.c_str(), &dst_st) == 0) {
        if (S_ISDIR(dst_st.st_mode)) {
            err = "destination is a directory";
            return false;
        }
        if (unlink(dst_path.c_str()) != 0) {
            err = std::string("cannot replace destination: ") + strerror(errno);
            return false;
        }
    }

    if (symlink(link_target.c_str(), dst_path.c_str()) != 0) {
        err = std::string("cannot create link: ") + strerror(errno);
        return false;
    }

    if (lchown(dst_path.c_str(), st.st_uid, st.st_gid) != 0) {
        err = "cannot set owner " + std::to_string(st.st_uid) + ":" + std::to_string(st.st_gid) +
              ": " + strerror(errno);
        return false;
    }

    diskmv_copy_link_xattrs(entry.src_path, dst_path);

    const struct timespec times[2] = { st.st_atim, st.st_mtim };
    if (utimensat(AT_FDCWD, dst_path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        err = std::string("cannot set link timestamps: ") + strerror(errno);
        return false;
    }

    return true;
}

bool PosixObjectCopier::precheck(const CandidateEntry& entry, const Volume& dst, std::string& err) {
    std::string parent_rel = diskmv_parent_path(entry.rel_path);

    size_t pos = 0;
    while (!parent_rel.empty() && pos <= parent_rel.size()) {
        size_t next = parent_rel.find('/', pos);
        if (next == std::string::npos) next = parent_rel.size();
        std::string dir = diskmv_join_path(dst.mount_point, parent_rel.substr(0, next));
        pos = next + 1;

        struct stat st{};
        if (lstat(dir.c_str(), &st) != 0) {
            // Missing parents are created by copy().
            if (errno == ENOENT) return true;
            err = "cannot examine " + dir + ": " + strerror(errno);
            return false;
        }
        if (!S_ISDIR(st.st_mode)) {
            err = dir + " exists and is not a directory";
            return false;
        }
    }

    if (entry.type != EntryType::Directory && entry.dst_exists && S_ISDIR(entry.dst_st.st_mode)) {
        err = "destination is a directory";
        return false;
    }
    return true;
}

bool PosixObjectCopier::copy(const CandidateEntry& entry,
                             const Volume& src,
                             const Volume& dst,
                             std::string& err) {
    try {
        if (!make_parents(entry, src, dst, err)) {
            return false;
        }

        switch (entry.type) {
        case EntryType::Regular:   return copy_regular(entry, err);
        case EntryType::Directory: return copy_directory(entry, err);
        case EntryType::Symlink:   return copy_symlink(entry, err);
        case EntryType::Other:     break;
        }
        err = "unsupported file type";
        return false;
    } catch (const std::bad_alloc&) {
        err = "out of memory";
        return false;
    }
}
