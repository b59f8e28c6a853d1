// ============================================================
// file_io.cpp -- Descriptor ownership and in-kernel transfers
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <string>

#include <sys/mman.h>
#include <sys/sendfile.h>
#include <sys/stat.h>

using namespace file_io;

// sendfile(2) transfers at most this many bytes per call
static constexpr u64 SENDFILE_MAX = 0x7ffff000ULL;

// ============================================================
// Pipe
// ============================================================

Pipe::Pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw KernelResourceError("pipe2", errno);
    }
    read_.reset(fds[0]);
    write_.reset(fds[1]);
}

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(int fd, u64 size) : size_(size) {
    if (size_ == 0) return;

    void* p = ::mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd, 0);
    if (p == MAP_FAILED) {
        throw KernelResourceError("mmap", errno);
    }
    ::madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    if (data_) ::munmap((void*)data_, (size_t)size_);
}

// ============================================================
// Utility functions
// ============================================================

void file_io::copy_range(int dst_fd, int src_fd, u64 size) {
    while (size > 0) {
        size_t want = (size_t)(size < SENDFILE_MAX ? size : SENDFILE_MAX);
        ssize_t n = ::sendfile(dst_fd, src_fd, nullptr, want);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw KernelResourceError("sendfile", errno);
        }
        if (n == 0) {
            // Source shrank under us; looping would never terminate
            throw ShortTransferAssertion("sendfile made no progress with " +
                                         std::to_string(size) + " bytes left");
        }
        size -= (u64)n;
    }
}

void file_io::set_times(int fd, const timespec& atime, const timespec& mtime) {
    timespec ts[2] = { atime, mtime };
    if (::futimens(fd, ts) != 0) {
        throw KernelResourceError("futimens", errno);
    }
}

void file_io::set_times(const std::string& path, const timespec& atime, const timespec& mtime) {
    timespec ts[2] = { atime, mtime };
    if (::utimensat(AT_FDCWD, path.c_str(), ts, 0) != 0) {
        throw PathError(path, errno);
    }
}

void file_io::rewind(int fd) {
    if (::lseek(fd, 0, SEEK_SET) < 0) {
        throw KernelResourceError("lseek", errno);
    }
}
