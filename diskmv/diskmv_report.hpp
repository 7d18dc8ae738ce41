#pragma once

#include "diskmv_types.hpp"

#include <cstdio>
#include <string>

// -----------------------------------------------------------------------------
// Run reporter: user-facing lines on stdout
// -----------------------------------------------------------------------------
//
// Independent from logging. The dry-run banner and the final summary are always
// printed; per-entry lines follow the policy verbosity.
class RunReporter {
public:
    RunReporter(FILE* out, const MovePolicy& policy) noexcept : out_(out), policy_(policy) {}

    void begin(const std::string& share_path, const Volume& src, const Volume& dst);

    // detail is the filter reason for skips and the error for failures.
    void entry(const CandidateEntry& entry, MoveOutcome outcome, const std::string& detail);

    void finish(const RunSummary& summary);

private:
    FILE* out_;
    const MovePolicy& policy_;
};

// rsync-style itemized change string for an entry about to be copied, e.g.
// ">f+++++++++" for a new file or ">f.st......" for a changed one.
std::string diskmv_itemize_changes(const CandidateEntry& entry);
