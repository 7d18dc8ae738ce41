#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include <sys/stat.h>

// -----------------------------------------------------------------------------
// Move policy: immutable snapshot of the command line
// -----------------------------------------------------------------------------
struct MovePolicy {
    bool dry_run = true;
    bool keep_source = false;
    bool copy_symlinks = false;
    bool clobber = false;
    std::optional<uint64_t> max_size_bytes;
    // Lower-case, without the leading dot.
    std::optional<std::set<std::string>> allowed_extensions;
    int verbosity = 1;
};

enum class UsageError { None, InvalidPath, InvalidDisk, SameDisk, BadArgument };

const char* diskmv_usage_error_name(UsageError err) noexcept;

// A mounted volume taking part in the run.
struct Volume {
    std::string id;
    std::string mount_point;
};

// -----------------------------------------------------------------------------
// Candidate entries and their outcomes
// -----------------------------------------------------------------------------
enum class EntryType { Regular, Directory, Symlink, Other };

EntryType diskmv_entry_type(mode_t mode) noexcept;
const char* diskmv_entry_type_name(EntryType type) noexcept;

struct CandidateEntry {
    std::string rel_path;          // share-relative
    std::string src_path;          // absolute, on the source volume
    std::string dst_path;          // absolute, on the destination volume
    EntryType type = EntryType::Other;
    struct stat src_st{};
    bool dst_exists = false;
    struct stat dst_st{};
    // Directories only: nothing left inside (or, in a dry run, nothing would be).
    bool dir_empty = false;

    uint64_t size() const noexcept {
        return type == EntryType::Regular ? static_cast<uint64_t>(src_st.st_size) : 0;
    }
};

enum class Eligibility { Eligible, SkipBusy, SkipDuplicate, SkipFiltered };

struct Verdict {
    Eligibility eligibility = Eligibility::Eligible;
    std::string reason;
};

enum class MoveOutcome { Moved, SkippedDuplicate, SkippedBusy, SkippedFiltered, DryRunWouldMove, Failed };

const char* diskmv_outcome_name(MoveOutcome outcome) noexcept;

struct RunSummary {
    uint64_t moved = 0;
    uint64_t would_move = 0;
    uint64_t skipped_duplicate = 0;
    uint64_t skipped_busy = 0;
    uint64_t skipped_filtered = 0;
    uint64_t failed = 0;
    uint64_t bytes = 0;
    bool interrupted = false;

    void count(MoveOutcome outcome) noexcept;
};
