// ============================================================
// zero_copy_pump.cpp -- Move file bytes into a sink fd via splice
// ============================================================

#include "zero_copy_pump.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include <string>

using namespace digest;

static ssize_t splice_once(int fd_in, int fd_out, size_t len, unsigned int flags) {
    for (;;) {
        ssize_t n = ::splice(fd_in, nullptr, fd_out, nullptr, len, flags);
        if (n >= 0) return n;
        if (errno != EINTR) throw KernelResourceError("splice", errno);
    }
}

size_t digest::splice_chunk_limit() {
    return platform::page_size() * 16;
}

void digest::pump(int source_fd, int sink_fd, u64 size) {
    const size_t limit = splice_chunk_limit();
    file_io::Pipe pipe;

    while (size > 0) {
        size_t       len   = (size_t)(size <= limit ? size : limit);
        unsigned int flags = SPLICE_F_MOVE;
        if (size > limit) flags |= SPLICE_F_MORE;

        ssize_t nr = splice_once(source_fd, pipe.write_end(), len, flags);
        if (nr == 0) {
            // Nothing in the pipe: the next splice would block forever
            throw ShortTransferAssertion("source ended with " +
                                         std::to_string(size) + " bytes left to digest");
        }
        ssize_t nw = splice_once(pipe.read_end(), sink_fd, (size_t)nr, flags);
        if (nr != nw) {
            throw ShortTransferAssertion("splice moved " + std::to_string(nr) +
                                         " bytes in but " + std::to_string(nw) + " out");
        }
        size -= (u64)nr;
    }
}

void digest::finalize_empty(int sink_fd) {
    for (;;) {
        ssize_t n = ::write(sink_fd, "", 0);
        if (n >= 0) return;
        if (errno != EINTR) throw KernelResourceError("write", errno);
    }
}

Digest digest::read_exact(int fd, size_t n) {
    Digest out(n);
    size_t got = 0;
    while (got < n) {
        ssize_t r = ::read(fd, out.data() + got, n - got);
        if (r < 0) {
            if (errno == EINTR) continue;
            throw KernelResourceError("read", errno);
        }
        if (r == 0) {
            throw ShortTransferAssertion("digest ended after " + std::to_string(got) +
                                         " of " + std::to_string(n) + " bytes");
        }
        got += (size_t)r;
    }
    return out;
}
