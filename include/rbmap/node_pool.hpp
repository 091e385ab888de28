// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <sys/mman.h>

#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <vector>

namespace rbmap {

// Compile-time flag for statistics tracking
#ifdef RBMAP_ALLOCATOR_STATS
inline constexpr bool allocator_stats_enabled = true;
#else
inline constexpr bool allocator_stats_enabled = false;
#endif

/**
 * Type-erased arena for fixed-size tree nodes.
 *
 * Memory comes from large mmap'd regions and is handed out by bumping a
 * pointer; freed blocks go onto an intrusive free list and are reused before
 * the bump pointer advances. Every block from one pool has the same size
 * (fixed by the first allocation), which is what a tree's rebound node
 * allocator asks for, so a recycled block always fits.
 *
 * Features:
 * - Nodes packed densely at their natural alignment
 * - Dynamic growth: the pool adds a region when the current one is exhausted
 * - Optional explicit hugepages (2MB on Linux x86-64) with fallback to
 *   regular pages, which are advised for transparent hugepages
 * - Optional statistics tracking (define RBMAP_ALLOCATOR_STATS)
 *
 * Implementation notes:
 * - Not thread-safe
 * - Requires block size >= sizeof(void*) for the free list
 * - Regions are only returned to the OS when the pool is destroyed
 */
class NodePool {
 public:
  using size_type = std::size_t;

 private:
  static constexpr size_type HUGEPAGE_SIZE = 2 * 1024 * 1024;  // 2MB

  struct MemoryRegion {
    std::byte* base = nullptr;
    size_type size = 0;
  };

  /**
   * Statistics tracked by the pool.
   * Only populated when allocator_stats_enabled is true.
   */
  struct Stats {
    size_type allocations{0};      // Total allocations
    size_type deallocations{0};    // Total deallocations
    size_type growth_events{0};    // Number of pool growths
    size_type current_blocks{0};   // Blocks currently handed out
    size_type peak_blocks{0};      // Peak blocks handed out

    void record_allocation() {
      if constexpr (allocator_stats_enabled) {
        ++allocations;
        ++current_blocks;
        if (current_blocks > peak_blocks) {
          peak_blocks = current_blocks;
        }
      }
    }

    void record_deallocation() {
      if constexpr (allocator_stats_enabled) {
        ++deallocations;
        --current_blocks;
      }
    }

    void record_growth() {
      if constexpr (allocator_stats_enabled) {
        ++growth_events;
      }
    }
  };

  std::vector<MemoryRegion> regions_;
  std::byte* next_free_;
  size_type bytes_remaining_;
  const size_type initial_size_;
  const size_type growth_size_;
  const bool hugepages_requested_;
  bool using_hugepages_;
  size_type block_size_;  // 0 until the first allocation
  void* free_list_head_;  // Head of intrusive free list
  Stats stats_;

 public:
  /**
   * Construct pool with specified configuration.
   *
   * @param initial_size Initial size of the arena in bytes (default 4MB)
   * @param use_hugepages If true, attempt explicit hugepages first (default
   * false)
   * @param growth_size Size of additional regions when the pool grows
   * (default 4MB)
   * @throws std::bad_alloc if no memory can be mapped
   */
  explicit NodePool(size_type initial_size = 4 * 1024 * 1024,
                    bool use_hugepages = false,
                    size_type growth_size = 4 * 1024 * 1024)
      : next_free_(nullptr),
        bytes_remaining_(0),
        initial_size_(initial_size),
        growth_size_(growth_size),
        hugepages_requested_(use_hugepages),
        using_hugepages_(false),
        block_size_(0),
        free_list_head_(nullptr) {
    MemoryRegion initial_region;

    if (use_hugepages) {
      initial_region = allocate_hugepages_region(initial_size);
      if (initial_region.base != nullptr) {
        using_hugepages_ = true;
      }
    }

    // Fall back to regular pages if hugepages unavailable or not requested
    if (initial_region.base == nullptr) {
      initial_region = allocate_regular_region(initial_size);
    }

    regions_.push_back(initial_region);
    next_free_ = initial_region.base;
    bytes_remaining_ = initial_region.size;
  }

  ~NodePool() {
    for (const auto& region : regions_) {
      if (region.base != nullptr) {
        munmap(region.base, region.size);
      }
    }
  }

  // Non-copyable, non-movable
  NodePool(const NodePool&) = delete;
  NodePool& operator=(const NodePool&) = delete;

  /**
   * Allocate one block.
   *
   * @param bytes Block size; must match every earlier request to this pool
   * @param alignment Required alignment (must be power of 2)
   * @return Pointer to allocated memory
   * @throws std::invalid_argument if bytes differs from the pool's block size
   * or is smaller than a pointer
   * @throws std::bad_alloc if unable to grow pool
   */
  void* allocate(size_type bytes, size_type alignment) {
    if (bytes == 0) {
      return nullptr;
    }

    if (block_size_ == 0) {
      if (bytes < sizeof(void*)) {
        throw std::invalid_argument(
            "NodePool: block size must be at least sizeof(void*)");
      }
      block_size_ = bytes;
    } else if (bytes != block_size_) {
      throw std::invalid_argument(
          "NodePool: all blocks from one pool must have the same size");
    }

    // Recycle a freed block first
    if (free_list_head_ != nullptr) {
      void* ptr = free_list_head_;
      free_list_head_ = *static_cast<void**>(ptr);
      stats_.record_allocation();
      return ptr;
    }

    // Align next_free to requested boundary
    std::uintptr_t current = reinterpret_cast<std::uintptr_t>(next_free_);
    std::uintptr_t aligned = (current + alignment - 1) &
                             ~(static_cast<std::uintptr_t>(alignment) - 1);
    size_type padding = aligned - current;

    if (bytes_remaining_ < bytes + padding) {
      grow(bytes + alignment);
      current = reinterpret_cast<std::uintptr_t>(next_free_);
      aligned = (current + alignment - 1) &
                ~(static_cast<std::uintptr_t>(alignment) - 1);
      padding = aligned - current;
    }

    next_free_ = reinterpret_cast<std::byte*>(aligned);
    void* result = next_free_;
    next_free_ += bytes;
    bytes_remaining_ -= (bytes + padding);

    stats_.record_allocation();
    return result;
  }

  /**
   * Return a block to the free list.
   *
   * @param ptr Pointer previously returned by allocate()
   */
  void deallocate(void* ptr) {
    if (ptr == nullptr) {
      return;
    }

    *static_cast<void**>(ptr) = free_list_head_;
    free_list_head_ = ptr;

    stats_.record_deallocation();
  }

  /**
   * Check if pool is using hugepages.
   */
  bool using_hugepages() const { return using_hugepages_; }

  /**
   * Get remaining bytes in the current region.
   */
  size_type bytes_remaining() const { return bytes_remaining_; }

  /**
   * Block size fixed by the first allocation (0 before it).
   */
  size_type block_size() const { return block_size_; }

  /**
   * Number of mapped regions (1 + number of growths).
   */
  size_type region_count() const { return regions_.size(); }

  /**
   * Configuration accessors (for the rebind constructor).
   */
  size_type initial_size() const { return initial_size_; }
  size_type growth_size() const { return growth_size_; }
  bool hugepages_requested() const { return hugepages_requested_; }

  /**
   * Statistics accessors. Only tracked when RBMAP_ALLOCATOR_STATS is defined.
   */
  size_type get_allocations() const { return stats_.allocations; }
  size_type get_deallocations() const { return stats_.deallocations; }
  size_type get_growth_events() const { return stats_.growth_events; }
  size_type get_current_blocks() const { return stats_.current_blocks; }
  size_type get_peak_blocks() const { return stats_.peak_blocks; }

 private:
  /**
   * Add a region of at least min_bytes (normally growth_size_).
   * The tail of the previous region is abandoned.
   */
  void grow(size_type min_bytes) {
    const size_type size = growth_size_ > min_bytes ? growth_size_ : min_bytes;
    MemoryRegion new_region;

    if (using_hugepages_) {
      new_region = allocate_hugepages_region(size);
    }
    if (new_region.base == nullptr) {
      new_region = allocate_regular_region(size);
    }

    regions_.push_back(new_region);
    next_free_ = new_region.base;
    bytes_remaining_ = new_region.size;

    stats_.record_growth();
  }

  MemoryRegion allocate_hugepages_region(size_type size) {
    // Round up to hugepage boundary
    size_type aligned_size = (size + HUGEPAGE_SIZE - 1) & ~(HUGEPAGE_SIZE - 1);

    void* ptr = mmap(nullptr, aligned_size, PROT_READ | PROT_WRITE,
                     MAP_PRIVATE | MAP_ANONYMOUS | MAP_HUGETLB, -1, 0);

    if (ptr == MAP_FAILED) {
      return {nullptr, 0};  // Hugepages not available
    }

    // Pre-fault so the hugepages are reserved now rather than on first use
    for (size_type i = 0; i < aligned_size; i += HUGEPAGE_SIZE) {
      static_cast<volatile char*>(ptr)[i] = 0;
    }

    return {static_cast<std::byte*>(ptr), aligned_size};
  }

  MemoryRegion allocate_regular_region(size_type size) {
    void* ptr = mmap(nullptr, size, PROT_READ | PROT_WRITE,
                     MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);

    if (ptr == MAP_FAILED) {
      throw std::bad_alloc();
    }

    // Hint to use transparent hugepages if available
    madvise(ptr, size, MADV_HUGEPAGE);

    return {static_cast<std::byte*>(ptr), size};
  }
};

}  // namespace rbmap
