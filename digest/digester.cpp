// ============================================================
// digester.cpp -- Content digest of an open file region
// ============================================================

#include "digester.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"

// xxhash.h from the system xxhash library; XXH_STATIC_LINKING_ONLY for XXH3
#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

using namespace digest;

// Store a 128-bit xxh3 result big-endian for determinism
static Digest to_bytes(const XXH128_hash_t& h) {
    Digest result(16);
    u64 hi = h.high64;
    u64 lo = h.low64;
    for (int i = 0; i < 8; ++i) {
        result[i]     = (u8)(hi >> (56 - 8 * i));
        result[8 + i] = (u8)(lo >> (56 - 8 * i));
    }
    return result;
}

Digest KernelDigester::digest(int fd, u64 size) const {
    DigestSession session = socket_.open();
    return session.digest(fd, size);
}

Digest Xxh3Digester::digest(int fd, u64 size) const {
    file_io::MmapReader reader(fd, size);
    XXH128_hash_t h = XXH3_128bits(reader.data(), (size_t)reader.size());
    file_io::rewind(fd);
    return to_bytes(h);
}

std::unique_ptr<Digester> digest::make_digester(const std::string& name,
                                                const std::optional<std::string>& key) {
    const AlgorithmDescriptor& algo = AlgorithmRegistry::instance().at(name);

    switch (algo.backend) {
        case Backend::Kernel:
            return std::make_unique<KernelDigester>(algo, key);
        case Backend::Userspace:
            if (key) throw ConfigurationError("algorithm " + name + " does not take a key");
            return std::make_unique<Xxh3Digester>(algo);
        case Backend::Null:
            if (key) throw ConfigurationError("algorithm " + name + " does not take a key");
            return std::make_unique<NullDigester>(algo);
    }
    throw ConfigurationError("unsupported digest back-end for " + name);
}
