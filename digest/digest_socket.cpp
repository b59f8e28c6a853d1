// ============================================================
// digest_socket.cpp -- Kernel crypto transform socket (AF_ALG)
// ============================================================

#include "digest_socket.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include <cstring>
#include <stdexcept>

#include <sys/socket.h>
#include <linux/if_alg.h>

#ifndef SOL_ALG
#  define SOL_ALG 279
#endif

using namespace digest;

static_assert(sizeof(BindRecord) == sizeof(struct sockaddr_alg),
              "BindRecord must match the kernel's sockaddr_alg");

static const char ALG_TYPE_HASH[] = "hash";

BindRecord digest::make_bind_record(const std::string& kernel_name) {
    BindRecord rec;
    std::memset(&rec, 0, sizeof(rec));

    if (kernel_name.empty()) {
        throw ConfigurationError("empty kernel algorithm name");
    }
    if (kernel_name.size() >= sizeof(rec.name)) {
        throw ConfigurationError("kernel algorithm name too long (max " +
                                 std::to_string(sizeof(rec.name) - 1) + " bytes): " +
                                 kernel_name);
    }

    rec.family = AF_ALG;
    std::memcpy(rec.type, ALG_TYPE_HASH, sizeof(ALG_TYPE_HASH));
    rec.feat = 0;
    rec.mask = 0;
    std::memcpy(rec.name, kernel_name.data(), kernel_name.size());
    return rec;
}

// ============================================================
// DigestSession
// ============================================================

Digest DigestSession::digest(int source_fd, u64 size) {
    if (consumed_) {
        throw std::logic_error("transform instance already produced its digest");
    }
    consumed_ = true;

    try {
        if (size == 0) {
            finalize_empty(fd_.get());
        } else {
            pump(source_fd, fd_.get(), size);
        }
    } catch (...) {
        file_io::rewind(source_fd);
        throw;
    }
    file_io::rewind(source_fd);

    return read_exact(fd_.get(), digest_size_);
}

// ============================================================
// DigestSocket
// ============================================================

DigestSocket::DigestSocket(const AlgorithmDescriptor& algo,
                           const std::optional<std::string>& key)
    : algo_(algo)
{
    if (algo_.backend != Backend::Kernel) {
        throw ConfigurationError("not a kernel algorithm: " + algo_.name);
    }
    if (algo_.key_required && !key) {
        throw ConfigurationError("algorithm " + algo_.name + " requires a key");
    }

    BindRecord rec = make_bind_record(algo_.kernel_name);

    int fd = ::socket(AF_ALG, SOCK_SEQPACKET | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw KernelResourceError("socket(AF_ALG)", errno);
    }
    fd_.reset(fd);

    if (::bind(fd_.get(), reinterpret_cast<const sockaddr*>(&rec), sizeof(rec)) != 0) {
        int err = errno;
        if (err == ENOENT) {
            throw ConfigurationError("kernel has no hash transform '" +
                                     algo_.kernel_name + "'");
        }
        throw KernelResourceError("bind", err);
    }

    if (key) {
        if (::setsockopt(fd_.get(), SOL_ALG, ALG_SET_KEY,
                         key->data(), (socklen_t)key->size()) != 0)
        {
            throw ConfigurationError("key rejected for " + algo_.name + ": " +
                                     os_error_str(errno));
        }
    }

    LOG_DEBUG("bound AF_ALG hash socket: " + algo_.kernel_name +
              " (" + std::to_string(algo_.digest_size) + " bytes)");
}

DigestSession DigestSocket::open() const {
    for (;;) {
        int fd = ::accept4(fd_.get(), nullptr, nullptr, SOCK_CLOEXEC);
        if (fd >= 0) {
            return DigestSession(file_io::UniqueFd(fd), algo_.digest_size);
        }
        if (errno != EINTR) throw KernelResourceError("accept", errno);
    }
}
