#pragma once

// ============================================================
// algorithm_registry.hpp -- Known digest algorithms
//
// Built once per process from a static table, then extended with
// the hash transforms the running kernel lists in /proc/crypto.
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <map>
#include <istream>

namespace digest {

enum class Backend {
    Kernel,     // AF_ALG transform socket
    Userspace,  // xxHash over a read-only mapping
    Null,       // zero-length digest, no I/O
};

struct AlgorithmDescriptor {
    std::string name;           // registry / command-line name
    std::string kernel_name;    // salg_name bound for Backend::Kernel
    size_t      digest_size{0};
    bool        key_required{false};
    Backend     backend{Backend::Kernel};
};

class AlgorithmRegistry {
public:
    // Process-wide registry, built on first use
    static const AlgorithmRegistry& instance();

    // Static table only (no /proc/crypto)
    AlgorithmRegistry();

    // Add entries for every 'shash' transform listed in a /proc/crypto
    // style stream; names already present are left alone
    void load_proc_crypto(std::istream& in);

    // nullptr if unknown
    const AlgorithmDescriptor* find(const std::string& name) const;

    // Throws ConfigurationError if unknown
    const AlgorithmDescriptor& at(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    void add(AlgorithmDescriptor desc);

    std::map<std::string, AlgorithmDescriptor> table_;
};

// Registry name for a kernel driver name, e.g. "sha256-generic" -> "sha256",
// "hmac(sha256-generic)" -> "hmac_sha256"
std::string driver_to_name(const std::string& driver);

} // namespace digest
