#pragma once

// ============================================================
// digester.hpp -- Content digest of an open file region
//
// The seam FileEntry digests through. Implementations must be
// safe to call from several worker threads at once.
// ============================================================

#include "../common/platform.hpp"
#include "algorithm_registry.hpp"
#include "digest_socket.hpp"
#include "zero_copy_pump.hpp"
#include <memory>
#include <optional>
#include <string>

namespace digest {

class Digester {
public:
    virtual ~Digester() = default;

    // Digest the first 'size' bytes of fd; fd is left at offset 0
    virtual Digest digest(int fd, u64 size) const = 0;

    virtual const AlgorithmDescriptor& algorithm() const = 0;
};

// AF_ALG: one fresh transform instance per call
class KernelDigester : public Digester {
public:
    KernelDigester(const AlgorithmDescriptor& algo, const std::optional<std::string>& key)
        : socket_(algo, key) {}

    Digest digest(int fd, u64 size) const override;
    const AlgorithmDescriptor& algorithm() const override { return socket_.algorithm(); }

private:
    DigestSocket socket_;
};

// xxh3-128 over a read-only mapping, big-endian output
class Xxh3Digester : public Digester {
public:
    explicit Xxh3Digester(const AlgorithmDescriptor& algo) : algo_(algo) {}

    Digest digest(int fd, u64 size) const override;
    const AlgorithmDescriptor& algorithm() const override { return algo_; }

private:
    AlgorithmDescriptor algo_;
};

// Zero-length digest; comparisons fall back to metadata
class NullDigester : public Digester {
public:
    explicit NullDigester(const AlgorithmDescriptor& algo) : algo_(algo) {}

    Digest digest(int, u64) const override { return {}; }
    const AlgorithmDescriptor& algorithm() const override { return algo_; }

private:
    AlgorithmDescriptor algo_;
};

// Look up 'name' in the registry and build the matching back-end.
// Throws ConfigurationError / KernelResourceError.
std::unique_ptr<Digester> make_digester(const std::string& name,
                                        const std::optional<std::string>& key = std::nullopt);

} // namespace digest
