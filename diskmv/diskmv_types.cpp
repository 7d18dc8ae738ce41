#include "diskmv_types.hpp"

const char* diskmv_usage_error_name(UsageError err) noexcept {
    switch (err) {
    case UsageError::None:        return "none";
    case UsageError::InvalidPath: return "invalid path";
    case UsageError::InvalidDisk: return "invalid disk";
    case UsageError::SameDisk:    return "same disk";
    case UsageError::BadArgument: return "bad argument";
    }
    return "unknown";
}

EntryType diskmv_entry_type(mode_t mode) noexcept {
    if (S_ISREG(mode)) return EntryType::Regular;
    if (S_ISDIR(mode)) return EntryType::Directory;
    if (S_ISLNK(mode)) return EntryType::Symlink;
    return EntryType::Other;
}

const char* diskmv_entry_type_name(EntryType type) noexcept {
    switch (type) {
    case EntryType::Regular:   return "file";
    case EntryType::Directory: return "directory";
    case EntryType::Symlink:   return "symlink";
    case EntryType::Other:     return "special file";
    }
    return "special file";
}

const char* diskmv_outcome_name(MoveOutcome outcome) noexcept {
    switch (outcome) {
    case MoveOutcome::Moved:            return "moved";
    case MoveOutcome::SkippedDuplicate: return "skipped-duplicate";
    case MoveOutcome::SkippedBusy:      return "skipped-busy";
    case MoveOutcome::SkippedFiltered:  return "skipped-filtered";
    case MoveOutcome::DryRunWouldMove:  return "dry-run-would-move";
    case MoveOutcome::Failed:           return "failed";
    }
    return "failed";
}

void RunSummary::count(MoveOutcome outcome) noexcept {
    switch (outcome) {
    case MoveOutcome::Moved:            ++moved; break;
    case MoveOutcome::SkippedDuplicate: ++skipped_duplicate; break;
    case MoveOutcome::SkippedBusy:      ++skipped_busy; break;
    case MoveOutcome::SkippedFiltered:  ++skipped_filtered; break;
    case MoveOutcome::DryRunWouldMove:  ++would_move; break;
    case MoveOutcome::Failed:           ++failed; break;
    }
}
