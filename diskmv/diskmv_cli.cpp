#include "diskmv_cli.hpp"
#include "diskmv_config.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <set>

#include <getopt.h>

// Strict decimal kilobyte count, converted to bytes.
static bool diskmv_parse_kilobytes(const char* text, uint64_t& bytes) noexcept {
    if (!text || !*text) return false;

    uint64_t kb = 0;
    for (const char* p = text; *p; ++p) {
        if (*p < '0' || *p > '9') return false;
        unsigned digit = static_cast<unsigned>(*p - '0');
        if (kb > (std::numeric_limits<uint64_t>::max() - digit) / 10) return false;
        kb = kb * 10 + digit;
    }

    if (kb > std::numeric_limits<uint64_t>::max() / constants::KIB) return false;
    bytes = kb * constants::KIB;
    return true;
}

static bool diskmv_parse_extensions(const char* text, std::set<std::string>& out) {
    out.clear();
    for (auto ext : diskmv_split_list(text ? text : "", ',')) {
        while (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
        if (ext.empty()) continue;
        for (auto& c : ext) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        out.insert(ext);
    }
    return !out.empty();
}

UsageError diskmv_parse_args(int argc, char* argv[], CliArgs& args, std::string& err) {
    static struct option long_opts[] = {{"test", no_argument, nullptr, 't'},
                                        {"force", no_argument, nullptr, 'f'},
                                        {"keepsource", no_argument, nullptr, 'k'},
                                        {"links", no_argument, nullptr, 'l'},
                                        {"clobber", no_argument, nullptr, 'c'},
                                        {"small", required_argument, nullptr, 's'},
                                        {"extension", required_argument, nullptr, 'e'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"quiet", no_argument, nullptr, 'q'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    args = CliArgs{};

    // Full rescan on every call, error text is produced here.
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, ":tfklcs:e:vqh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 't':
            args.policy.dry_run = true;
            break;
        case 'f':
            args.policy.dry_run = false;
            break;
        case 'k':
            args.policy.keep_source = true;
            break;
        case 'l':
            args.policy.copy_symlinks = true;
            break;
        case 'c':
            args.policy.clobber = true;
            break;
        case 's': {
            uint64_t bytes = 0;
            if (!diskmv_parse_kilobytes(optarg, bytes)) {
                err = std::string("invalid size for -s: ") + (optarg ? optarg : "");
                return UsageError::BadArgument;
            }
            args.policy.max_size_bytes = bytes;
            break;
        }
        case 'e': {
            std::set<std::string> exts;
            if (!diskmv_parse_extensions(optarg, exts)) {
                err = "-e needs a comma-separated list of extensions";
                return UsageError::BadArgument;
            }
            args.policy.allowed_extensions = std::move(exts);
            break;
        }
        case 'v':
            ++args.policy.verbosity;
            break;
        case 'q':
            --args.policy.verbosity;
            break;
        case 'h':
            args.help = true;
            return UsageError::None;
        case ':':
            err = std::string("option ") + argv[optind - 1] + " requires an argument";
            return UsageError::BadArgument;
        default:
            if (optopt != 0) {
                err = std::string("unknown option -") + static_cast<char>(optopt);
            } else {
                err = std::string("unknown option ") + argv[optind - 1];
            }
            return UsageError::BadArgument;
        }
    }

    int remaining = argc - optind;
    if (remaining != 3) {
        err = "expected path, source disk and destination disk";
        return UsageError::BadArgument;
    }

    args.path = argv[optind];
    args.src_disk = argv[optind + 1];
    args.dst_disk = argv[optind + 2];
    return UsageError::None;
}

void diskmv_print_usage(FILE* out, const char* argv0) {
    fprintf(out, "Usage: %s [-t|-f] [-k] [-l] [-c] [-s N] [-e LIST] [-v|-q] path srcdisk destdisk\n", argv0);
}

void diskmv_print_help(FILE* out, const char* argv0) {
    diskmv_print_usage(out, argv0);
    fprintf(out,
            "\n"
            "Move a share path from one array disk to another, keeping its place in the share.\n"
            "A file is removed from the source disk only after it was copied successfully.\n"
            "\n"
            "Options:\n"
            "  -t, --test           Dry run, report what would happen (default)\n"
            "  -f, --force          Actually move files\n"
            "  -k, --keepsource     Do not delete source files after copying\n"
            "  -l, --links          Copy symlinks as symlinks (default: skip them)\n"
            "  -c, --clobber        Overwrite files that already exist on the destination\n"
            "  -s, --small N        Only move files of at most N kilobytes\n"
            "  -e, --extension LIST Only move files with an extension in LIST (e.g. mkv,avi)\n"
            "  -v, --verbose        More output, repeatable\n"
            "  -q, --quiet          Less output, repeatable\n"
            "  -h, --help           Show this help\n"
            "\n"
            "path may be absolute (/mnt/user/movies, /mnt/disk2/movies) or share-relative (movies).\n"
            "Disks are named like disk2 or cache, or given as their mount point.\n");
}
