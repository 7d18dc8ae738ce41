#pragma once

#include "diskmv_config.hpp"
#include "diskmv_types.hpp"

#include <cstdint>
#include <string>

// -----------------------------------------------------------------------------
// Metadata-preserving single-object copy
// -----------------------------------------------------------------------------
class ObjectCopier {
public:
    virtual ~ObjectCopier() = default;

    // Replicates entry.src_path at entry.dst_path, creating missing parent
    // directories under dst. Directories are created without their children.
    // On failure err says why and the source must be left alone.
    virtual bool copy(const CandidateEntry& entry,
                      const Volume& src,
                      const Volume& dst,
                      std::string& err) = 0;

    // Read-only check of the destination side: fails when copy() is certain
    // to fail because of what already sits at or above entry.dst_path.
    virtual bool precheck(const CandidateEntry& entry, const Volume& dst, std::string& err) = 0;
};

// Whole-file copy updating the destination in place. Preserves mode, numeric
// owner and group, ACLs and other extended attributes, access and
// modification times.
class PosixObjectCopier : public ObjectCopier {
public:
    explicit PosixObjectCopier(const Config& cfg) : cfg_(cfg) {}

    bool copy(const CandidateEntry& entry,
              const Volume& src,
              const Volume& dst,
              std::string& err) override;

    bool precheck(const CandidateEntry& entry, const Volume& dst, std::string& err) override;

private:
    bool make_parents(const CandidateEntry& entry, const Volume& src, const Volume& dst, std::string& err);
    bool copy_regular(const CandidateEntry& entry, std::string& err);
    bool copy_directory(const CandidateEntry& entry, std::string& err);
    bool copy_symlink(const CandidateEntry& entry, std::string& err);

    const Config& cfg_;
};

// Copies exactly file_size bytes from src_fd to dst_fd.
bool diskmv_copy_fd(int src_fd, int dst_fd, uint64_t file_size, const Config& cfg) noexcept;

bool diskmv_check_destination_space(const std::string& dir,
                                    uint64_t needed,
                                    uint64_t reclaimable,
                                    const Config& cfg) noexcept;

// user.* and POSIX ACLs must survive a copy; other namespaces (security.*,
// trusted.*) are carried when the process is allowed to set them.
bool diskmv_xattr_is_required(const char* name) noexcept;
