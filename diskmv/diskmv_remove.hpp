#pragma once

#include "diskmv_config.hpp"
#include "diskmv_types.hpp"

#include <string>

// -----------------------------------------------------------------------------
// Source removal after a confirmed copy
// -----------------------------------------------------------------------------
class ObjectRemover {
public:
    virtual ~ObjectRemover() = default;

    // Deletes a file or symlink, or a directory only when it is empty.
    virtual bool remove(const CandidateEntry& entry, std::string& err) = 0;
};

// Refuses to delete a source that no longer is the object that was copied.
class PosixObjectRemover : public ObjectRemover {
public:
    explicit PosixObjectRemover(const Config& cfg) : cfg_(cfg) {}

    bool remove(const CandidateEntry& entry, std::string& err) override;

private:
    const Config& cfg_;
};
