#pragma once

// ============================================================
// digest_socket.hpp -- Kernel crypto transform socket (AF_ALG)
//
//   DigestSocket   bound "hash" socket for one algorithm; lives for
//                  the whole run and is shared read-only by workers
//   DigestSession  one accept()ed transform instance; single-shot,
//                  owned by exactly one digest computation
// ============================================================

#include "../common/platform.hpp"
#include "../common/file_io.hpp"
#include "algorithm_registry.hpp"
#include "zero_copy_pump.hpp"
#include <string>
#include <cstddef>
#include <optional>

namespace digest {

// Wire layout of struct sockaddr_alg as the kernel expects it
struct BindRecord {
    u16 family;
    u8  type[14];
    u32 feat;
    u32 mask;
    u8  name[64];
};

static_assert(sizeof(BindRecord) == 88, "sockaddr_alg is 88 bytes");
static_assert(offsetof(BindRecord, family) == 0,  "salg_family offset");
static_assert(offsetof(BindRecord, type)   == 2,  "salg_type offset");
static_assert(offsetof(BindRecord, feat)   == 16, "salg_feat offset");
static_assert(offsetof(BindRecord, mask)   == 20, "salg_mask offset");
static_assert(offsetof(BindRecord, name)   == 24, "salg_name offset");

// Build the record binding a "hash" transform named kernel_name.
// Throws ConfigurationError if the name (plus terminator) exceeds 64 bytes.
BindRecord make_bind_record(const std::string& kernel_name);

class DigestSession {
public:
    DigestSession(file_io::UniqueFd fd, size_t digest_size)
        : fd_(std::move(fd)), digest_size_(digest_size) {}

    DigestSession(DigestSession&&) = default;
    DigestSession& operator=(DigestSession&&) = default;

    // Feed 'size' bytes of source_fd through the transform and return
    // exactly digest_size bytes. source_fd is rewound to offset 0.
    // A session can produce one digest; a second call throws std::logic_error.
    Digest digest(int source_fd, u64 size);

private:
    file_io::UniqueFd fd_;
    size_t            digest_size_;
    bool              consumed_{false};
};

class DigestSocket {
public:
    // Throws ConfigurationError for a non-kernel or unknown algorithm,
    // a missing or rejected key; KernelResourceError if AF_ALG is unavailable
    DigestSocket(const AlgorithmDescriptor& algo,
                 const std::optional<std::string>& key = std::nullopt);

    DigestSocket(const DigestSocket&) = delete;
    DigestSocket& operator=(const DigestSocket&) = delete;

    // New independent transform instance; thread-safe
    DigestSession open() const;

    const AlgorithmDescriptor& algorithm() const { return algo_; }

private:
    AlgorithmDescriptor algo_;
    file_io::UniqueFd   fd_;
};

} // namespace digest
