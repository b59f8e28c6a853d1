#pragma once

// ============================================================
// zero_copy_pump.hpp -- Move file bytes into a sink fd via splice
//
// Each chunk goes source -> pipe -> sink with two splice(2) calls
// through a pipe that lives only for one pump() call. Chunks are
// capped at 16 pages, the pipe capacity of kernels before 4.11.
// ============================================================

#include "../common/platform.hpp"
#include <vector>

namespace digest {

using Digest = std::vector<u8>;

// Largest number of bytes moved per splice pair
size_t splice_chunk_limit();

// Splice exactly 'size' bytes from source_fd (at its current offset)
// into sink_fd. Throws KernelResourceError on a failing call and
// ShortTransferAssertion when the two halves of a chunk disagree.
void pump(int source_fd, int sink_fd, u64 size);

// Send a zero-length message so the transform finalizes on empty input
void finalize_empty(int sink_fd);

// Read exactly n bytes, accumulating partial reads
Digest read_exact(int fd, size_t n);

} // namespace digest
