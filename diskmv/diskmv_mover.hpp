#pragma once

#include "diskmv_copy.hpp"
#include "diskmv_filter.hpp"
#include "diskmv_remove.hpp"
#include "diskmv_report.hpp"
#include "diskmv_types.hpp"

#include <atomic>
#include <cstddef>
#include <string>

// -----------------------------------------------------------------------------
// Share mover: post-order walk driving filter, copy and delete
// -----------------------------------------------------------------------------
class ShareMover {
public:
    // All collaborators must outlive the mover. stop is polled before every
    // entry; the entry in progress always completes.
    ShareMover(const MovePolicy& policy,
               const FilterSet& filters,
               ObjectCopier& copier,
               ObjectRemover& remover,
               RunReporter& reporter,
               const std::atomic<bool>& stop) noexcept
        : policy_(policy), filters_(filters), copier_(copier),
          remover_(remover), reporter_(reporter), stop_(stop) {}

    RunSummary run(const std::string& share_path, const Volume& src, const Volume& dst);

private:
    // Returns true when the entry is gone from the source afterwards (or, in a
    // dry run, would be).
    bool visit(const std::string& rel, const Volume& src, const Volume& dst,
               size_t depth, RunSummary& summary);

    MoveOutcome process(const CandidateEntry& entry, const Volume& src, const Volume& dst,
                        RunSummary& summary);

    void fail(const CandidateEntry& entry, const std::string& err, RunSummary& summary);

    const MovePolicy& policy_;
    const FilterSet& filters_;
    ObjectCopier& copier_;
    ObjectRemover& remover_;
    RunReporter& reporter_;
    const std::atomic<bool>& stop_;
};
