#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace up {

struct ChunkBoundary {
  uint64_t start = 0;
  uint64_t end = 0;

  uint64_t size() const { return end - start; }
};

// Chunk ends grow 128 KiB, 256 KiB, ... up to 1 MiB, then stay at 1 MiB.
// The last chunk is cut at `size`. Zero returns E_EMPTY_SOURCE and leaves
// `out` empty.
int plan(uint64_t size, std::vector<ChunkBoundary>& out);

// Contiguous, starts at 0, ends at `size`, no empty ranges
bool valid_plan(const std::vector<ChunkBoundary>& bounds, uint64_t size);

}
