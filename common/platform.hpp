#pragma once

// ============================================================
// platform.hpp -- Linux syscall abstraction and portable types
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>

#ifndef __linux__
#  error "lesync needs Linux (AF_ALG, splice, sendfile)"
#endif

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// Human readable text for an errno value
inline std::string os_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

namespace platform {

inline size_t page_size() {
    long sz = ::sysconf(_SC_PAGESIZE);
    return sz > 0 ? (size_t)sz : 4096;
}

inline size_t cpu_count() {
    long n = ::sysconf(_SC_NPROCESSORS_ONLN);
    return n > 0 ? (size_t)n : 1;
}

// RAII umask override; restores the previous mask on scope exit
class UmaskGuard {
public:
    explicit UmaskGuard(mode_t mask) : old_(::umask(mask)) {}
    ~UmaskGuard() { ::umask(old_); }

    UmaskGuard(const UmaskGuard&) = delete;
    UmaskGuard& operator=(const UmaskGuard&) = delete;

private:
    mode_t old_;
};

} // namespace platform
