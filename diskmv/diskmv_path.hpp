#pragma once

#include "diskmv_config.hpp"
#include "diskmv_types.hpp"
#include "diskmv_volume.hpp"

#include <string>

// Drops empty and "." segments and any leading '/'. Fails on "..".
bool diskmv_normalize_share_path(const std::string& raw, std::string& out);

// True when the share path exists under the share root or on any known volume.
bool diskmv_share_path_exists(const std::string& rel,
                              const Config& cfg,
                              const VolumeLookup& lookup) noexcept;

// Turns a user supplied path (absolute, relative to the working directory, or
// share-relative) into a canonical share path.
UsageError diskmv_resolve_share_path(const std::string& input,
                                     const Config& cfg,
                                     const VolumeLookup& lookup,
                                     std::string& out,
                                     std::string& err);
