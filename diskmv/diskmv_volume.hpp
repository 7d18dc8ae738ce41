#pragma once

#include "diskmv_config.hpp"
#include "diskmv_types.hpp"

#include <string>
#include <vector>

// -----------------------------------------------------------------------------
// Disk name to mount point lookup
// -----------------------------------------------------------------------------
class VolumeLookup {
public:
    virtual ~VolumeLookup() = default;

    // Whether the bare identifier matches an accepted volume naming pattern.
    virtual bool accepts(const std::string& id) const = 0;

    // Where the identifier is mounted. Existence is checked by the caller.
    virtual std::string mount_point(const std::string& id) const = 0;

    // Every identifier the pattern accepts, in a stable order.
    virtual std::vector<std::string> known_volumes() const = 0;
};

// Volumes live directly under the configured mount root: <mnt_root>/disk1,
// <mnt_root>/cache, ...
class MountRootVolumeLookup : public VolumeLookup {
public:
    explicit MountRootVolumeLookup(const Config& cfg) : cfg_(cfg) {}

    bool accepts(const std::string& id) const override;
    std::string mount_point(const std::string& id) const override;
    std::vector<std::string> known_volumes() const override;

private:
    const Config& cfg_;
};

// "disk2", "/mnt/disk2" and "/mnt/disk2/movies/Foo" all yield "disk2".
std::string diskmv_bare_disk_id(const std::string& input, const Config& cfg);

UsageError diskmv_validate_disk(const std::string& input,
                                const Config& cfg,
                                const VolumeLookup& lookup,
                                Volume& out,
                                std::string& err);

// Validates both disks and rejects a source equal to the destination.
UsageError diskmv_validate_disk_pair(const std::string& src_input,
                                     const std::string& dst_input,
                                     const Config& cfg,
                                     const VolumeLookup& lookup,
                                     Volume& src,
                                     Volume& dst,
                                     std::string& err);
