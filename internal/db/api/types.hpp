#pragma once

#include <cstddef>
#include <cstdint>

namespace songqueue::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

struct StatusCounts {
  uint64_t pending   = 0;
  uint64_t playing   = 0;
  uint64_t completed = 0;
  uint64_t cancelled = 0;

  uint64_t Total() const {
    return pending + playing + completed + cancelled;
  }
};

} // namespace songqueue::db
