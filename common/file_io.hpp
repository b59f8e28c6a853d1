#pragma once

// ============================================================
// file_io.hpp -- Descriptor ownership and in-kernel transfers
// ============================================================

#include "platform.hpp"
#include <string>
#include <time.h>

namespace file_io {

// ---- UniqueFd: exclusive owner of one descriptor ----
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    // Non-copyable
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    // Movable
    UniqueFd(UniqueFd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& o) noexcept {
        if (this != &o) {
            reset();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }

    int  get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Close the owned descriptor (if any) and take ownership of fd
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_{-1};
};

// ---- Pipe: ephemeral kernel pipe, both ends closed on destruction ----
class Pipe {
public:
    Pipe();

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const  { return read_.get(); }
    int write_end() const { return write_.get(); }

private:
    UniqueFd read_;
    UniqueFd write_;
};

// ---- MmapReader: read-only mapping of an open descriptor ----
class MmapReader {
public:
    MmapReader(int fd, u64 size);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

private:
    const char* data_{nullptr};
    u64 size_{0};
};

// Copy 'size' bytes from the current offset of src_fd to the current
// offset of dst_fd without staging them in user memory. Loops until the
// whole range moved since one call may transfer less than requested.
void copy_range(int dst_fd, int src_fd, u64 size);

// Apply access/modification times to an open descriptor
void set_times(int fd, const timespec& atime, const timespec& mtime);

// Apply access/modification times to a path (used for directories)
void set_times(const std::string& path, const timespec& atime, const timespec& mtime);

// Reposition fd to the start of the file
void rewind(int fd);

} // namespace file_io
