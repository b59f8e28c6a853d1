// ============================================================
// digest/main.cpp -- lehash entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "algorithm_registry.hpp"
#include "hash_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [options] <file>...\n"
        << "\n"
        << "Print the digest of each file, computed by the kernel crypto API.\n"
        << "\nOptions:\n"
        << "  -a, --digest-algo NAME  algorithm (default: md5)\n"
        << "  -k, --digest-key KEY    key for keyed digests (hmac_*)\n"
        << "  -t, --threads N         files digested in parallel (default: CPU count)\n"
        << "  -v, --verbose           enable debug logging\n"
        << "      --list-algorithms   print known digest algorithms and exit\n"
        << "\nExample:\n"
        << "  " << prog << " -a sha256 /boot/vmlinuz*\n";
}

int main(int argc, char* argv[]) {
    HashConfig cfg;
    int threads = (int)cfg.threads;

    int i = 1;
    for (; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "--") == 0) { ++i; break; }
        if (a[0] != '-' || a[1] == '\0') break;

        if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if ((std::strcmp(a, "-a") == 0 || std::strcmp(a, "--digest-algo") == 0) && i + 1 < argc) {
            cfg.algorithm = argv[++i];
        } else if ((std::strcmp(a, "-k") == 0 || std::strcmp(a, "--digest-key") == 0) && i + 1 < argc) {
            cfg.key = std::string(argv[++i]);
        } else if ((std::strcmp(a, "-t") == 0 || std::strcmp(a, "--threads") == 0) && i + 1 < argc) {
            threads = std::atoi(argv[++i]);
        } else if (std::strcmp(a, "-v") == 0 || std::strcmp(a, "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(a, "--list-algorithms") == 0) {
            const auto& registry = digest::AlgorithmRegistry::instance();
            for (const auto& name : registry.names()) {
                std::cout << name << "  " << registry.find(name)->digest_size << " bytes\n";
            }
            return 0;
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }
    for (; i < argc; ++i) cfg.files.push_back(argv[i]);

    if (cfg.files.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (threads < 1 || threads > 1024) {
        std::cerr << "ERROR: --threads must be 1-1024\n";
        return 1;
    }
    cfg.threads = (size_t)threads;

    try {
        HashApp app(std::move(cfg), std::cout);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
