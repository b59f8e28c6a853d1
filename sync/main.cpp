// ============================================================
// sync/main.cpp -- lesync entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../digest/algorithm_registry.hpp"
#include "sync_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <clocale>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options] <src>... <dst>\n"
        << "\n"
        << "Copy files and directory trees, converting filename encodings.\n"
        << "With more than one <src>, <dst> must be an existing directory.\n"
        << "\nOptions:\n"
        << "  -v, --verbose           more output (repeat for debug)\n"
        << "  -n, --dry-run           show what would be copied, write nothing\n"
        << "  -S, --sync              skip files identical to the destination\n"
        << "  -M, --ignore-mtime      do not compare modification times with -S\n"
        << "  -I, --include PAT...    copy only paths matching PAT (default: */ *)\n"
        << "  -X, --exclude PAT...    never copy paths matching PAT\n"
        << "  -s, --src-enc NAME      source filename encoding (default: locale)\n"
        << "  -d, --dst-enc NAME      destination filename encoding (default: UTF-8)\n"
        << "  -a, --digest-algo NAME  content digest for -S (default: md5)\n"
        << "  -k, --digest-key KEY    key for keyed digests (hmac_*)\n"
        << "  -t, --threads N         parallel copy jobs (default: CPU count)\n"
        << "      --log-file PATH     also append log lines to PATH\n"
        << "      --list-algorithms   print known digest algorithms and exit\n"
        << "  -h, --help              show this help\n"
        << "\nPatterns are matched against paths that start with the base name\n"
        << "of each <src> (photos/2020/a.jpg), directories with a trailing '/'.\n"
        << "'*' also matches '/'. End a pattern list with --.\n"
        << "\nExample:\n"
        << "  " << prog << " -S -s CP932 -X '*.tmp' -- /data/photos /mnt/exfat\n";
}

static void print_algorithms() {
    const auto& registry = digest::AlgorithmRegistry::instance();
    for (const auto& name : registry.names()) {
        const digest::AlgorithmDescriptor* d = registry.find(name);
        std::cout << name << "  " << d->digest_size << " bytes";
        if (d->key_required) std::cout << "  (keyed)";
        if (d->backend == digest::Backend::Userspace) std::cout << "  (userspace)";
        std::cout << "\n";
    }
}

static bool is_flag(const char* arg, const char* s, const char* l) {
    return std::strcmp(arg, s) == 0 || std::strcmp(arg, l) == 0;
}

// Consume pattern arguments up to the next option or "--"
static void take_patterns(int argc, char* argv[], int& i, std::vector<std::string>& out) {
    out.clear();
    while (i + 1 < argc && argv[i + 1][0] != '-') {
        out.push_back(argv[++i]);
    }
    if (i + 1 < argc && std::strcmp(argv[i + 1], "--") == 0) ++i;
}

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "");

    SyncConfig cfg;
    int  verbose  = 0;
    bool list     = false;
    std::string log_file;
    int  threads  = (int)cfg.threads;

    int i = 1;
    for (; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "--") == 0) { ++i; break; }
        if (a[0] != '-' || a[1] == '\0') break;

        if (is_flag(a, "-h", "--help")) {
            print_usage(argv[0]);
            return 0;
        } else if (is_flag(a, "-v", "--verbose")) {
            ++verbose;
        } else if (a[1] == 'v' && std::strspn(a + 1, "v") == std::strlen(a + 1)) {
            verbose += (int)std::strlen(a + 1);
        } else if (is_flag(a, "-n", "--dry-run")) {
            cfg.dry_run = true;
        } else if (is_flag(a, "-S", "--sync")) {
            cfg.options.skip_identical = true;
        } else if (is_flag(a, "-M", "--ignore-mtime")) {
            cfg.options.compare_mtime = false;
        } else if (is_flag(a, "-I", "--include")) {
            take_patterns(argc, argv, i, cfg.options.include);
            if (cfg.options.include.empty()) {
                std::cerr << "ERROR: " << a << " needs at least one pattern\n";
                return 1;
            }
        } else if (is_flag(a, "-X", "--exclude")) {
            take_patterns(argc, argv, i, cfg.options.exclude);
            if (cfg.options.exclude.empty()) {
                std::cerr << "ERROR: " << a << " needs at least one pattern\n";
                return 1;
            }
        } else if (is_flag(a, "-s", "--src-enc") && i + 1 < argc) {
            cfg.src_encoding = argv[++i];
        } else if (is_flag(a, "-d", "--dst-enc") && i + 1 < argc) {
            cfg.dst_encoding = argv[++i];
        } else if (is_flag(a, "-a", "--digest-algo") && i + 1 < argc) {
            cfg.algorithm = argv[++i];
        } else if (is_flag(a, "-k", "--digest-key") && i + 1 < argc) {
            cfg.key = std::string(argv[++i]);
        } else if (is_flag(a, "-t", "--threads") && i + 1 < argc) {
            threads = std::atoi(argv[++i]);
        } else if (std::strcmp(a, "--log-file") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(a, "--list-algorithms") == 0) {
            list = true;
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    for (; i < argc; ++i) cfg.paths.push_back(argv[i]);

    Logger::get().set_verbosity(verbose, cfg.dry_run);
    if (!log_file.empty() && !Logger::get().set_log_file(log_file)) {
        std::cerr << "ERROR: cannot open log file: " << log_file << "\n";
        return 1;
    }

    if (list) {
        print_algorithms();
        return 0;
    }

    if (threads < 1 || threads > 1024) {
        std::cerr << "ERROR: --threads must be 1-1024\n";
        return 1;
    }
    cfg.threads = (size_t)threads;

    for (const auto& p : cfg.paths) {
        if (!utils::validate_path(p)) {
            std::cerr << "ERROR: Invalid path: '" << p << "'\n";
            return 1;
        }
    }
    if (cfg.paths.size() < 2) {
        std::cerr << "ERROR: two files required at least\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        SyncApp app(std::move(cfg));
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
