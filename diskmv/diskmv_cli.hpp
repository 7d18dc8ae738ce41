#pragma once

#include "diskmv_types.hpp"

#include <cstdio>
#include <string>

// -----------------------------------------------------------------------------
// Command line
// -----------------------------------------------------------------------------
struct CliArgs {
    MovePolicy policy;
    std::string path;
    std::string src_disk;
    std::string dst_disk;
    bool help = false;
};

// Parses argv into args. Returns UsageError::BadArgument with a one-line
// message in err on any malformed input. With -h only args.help is meaningful.
UsageError diskmv_parse_args(int argc, char* argv[], CliArgs& args, std::string& err);

void diskmv_print_usage(FILE* out, const char* argv0);
void diskmv_print_help(FILE* out, const char* argv0);
