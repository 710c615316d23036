#include <cstdio>

#include "up/plan.hpp"
#include "vaultup/errors.hpp"

namespace up {

static constexpr uint64_t KiB = 1024;
static constexpr uint64_t STEP = 128 * KiB;
static constexpr uint64_t MAX_CHUNK = 1024 * KiB;

int plan(uint64_t size, std::vector<ChunkBoundary>& out){
  out.clear();
  if (size == 0){
    std::fprintf(stderr, "[PLAN] refusing to plan an empty source\n");
    return vaultup::E_EMPTY_SOURCE;
  }

  uint64_t start = 0;
  uint64_t len = STEP;
  while (start < size){
    uint64_t end = (size - start > len) ? start + len : size;
    out.push_back({start, end});
    start = end;
    if (len < MAX_CHUNK) len += STEP;
  }
  return 0;
}

bool valid_plan(const std::vector<ChunkBoundary>& bounds, uint64_t size){
  if (bounds.empty() || size == 0) return false;
  uint64_t pos = 0;
  for (const auto& b : bounds){
    if (b.start != pos || b.end <= b.start) return false;
    pos = b.end;
  }
  return pos == size;
}

}
