#pragma once

#include <mimalloc.h>
#include <cstddef>
#include <memory_resource>

namespace xtstate {

// PMR memory_resource backed by mimalloc (mi_malloc_aligned / mi_free_aligned)
class mi_memory_resource : public std::pmr::memory_resource {
  void* do_allocate(std::size_t bytes, std::size_t alignment) override;
  void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override;
  bool do_is_equal(const memory_resource& other) const noexcept override;
};

// Process-wide mimalloc resource. Default backing store for slot tables and
// history logs.
std::pmr::memory_resource* mi_resource() noexcept;

}  // namespace xtstate
