// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <type_traits>

#include "node_pool.hpp"

namespace rbmap {

/**
 * Single-object allocator backed by a shared NodePool.
 *
 * Intended as the Allocator argument of rb_tree: the tree only ever
 * allocates one node at a time, and every rebind gets its own pool, so
 * element nodes and the sentinel live in separate arenas of uniformly sized
 * blocks.
 *
 * @code
 * PoolAllocator<std::pair<int, int>> alloc(1024 * 1024);
 * rb_tree<int, int, std::less<int>, decltype(alloc)> tree{alloc};
 * @endcode
 *
 * Implementation notes:
 * - Copies share the pool; rebinding creates a new pool with the same
 *   configuration
 * - Only supports allocating/deallocating 1 object at a time (throws for n!=1)
 * - Requires sizeof(T) >= sizeof(void*) for the intrusive free list
 * - Not thread-safe
 *
 * @tparam T The type to allocate
 */
template <typename T>
class PoolAllocator {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using propagate_on_container_copy_assignment = std::true_type;
  using propagate_on_container_move_assignment = std::true_type;
  using propagate_on_container_swap = std::true_type;
  using is_always_equal = std::false_type;

  static constexpr size_type object_size = sizeof(T);
  static constexpr size_type allocation_alignment =
      alignof(T) > alignof(void*) ? alignof(T) : alignof(void*);

  // Rebind support for STL containers
  template <typename U>
  struct rebind {
    using other = PoolAllocator<U>;
  };

  /**
   * Construct allocator with a new pool.
   *
   * @param initial_pool_size Initial size of the pool in bytes (default 4MB)
   * @param use_hugepages If true, attempt explicit hugepages (default false)
   * @param growth_size Size of additional regions when the pool grows
   * (default 4MB)
   */
  explicit PoolAllocator(size_type initial_pool_size = 4 * 1024 * 1024,
                         bool use_hugepages = false,
                         size_type growth_size = 4 * 1024 * 1024)
      : pool_(std::make_shared<NodePool>(initial_pool_size, use_hugepages,
                                         growth_size)) {}

  /**
   * Copy constructor (shares pool with other allocator).
   */
  PoolAllocator(const PoolAllocator& other) = default;
  PoolAllocator& operator=(const PoolAllocator& other) = default;

  /**
   * Rebind constructor (creates a separate pool for a different type).
   */
  template <typename U>
  explicit PoolAllocator(const PoolAllocator<U>& other)
      : pool_(std::make_shared<NodePool>(other.pool_->initial_size(),
                                         other.pool_->hugepages_requested(),
                                         other.pool_->growth_size())) {}

  /**
   * Allocate n objects of type T.
   *
   * @param n Number of objects to allocate (must be 1)
   * @throws std::invalid_argument if n != 1
   * @throws std::bad_alloc if unable to grow pool
   */
  T* allocate(size_type n) {
    static_assert(sizeof(T) >= sizeof(void*),
                  "Type T must be at least sizeof(void*) bytes for intrusive "
                  "free list");
    if (n == 0) {
      return nullptr;
    }

    if (n != 1) {
      throw std::invalid_argument(
          "PoolAllocator only supports allocating 1 object at a time");
    }

    return static_cast<T*>(pool_->allocate(object_size, allocation_alignment));
  }

  /**
   * Deallocate n objects at pointer p.
   *
   * @param p Pointer to memory to deallocate
   * @param n Number of objects (must be 1)
   */
  void deallocate(T* p, size_type n) {
    if (p == nullptr || n == 0) {
      return;
    }

    if (n != 1) {
      throw std::invalid_argument(
          "PoolAllocator only supports deallocating 1 object at a time");
    }

    pool_->deallocate(p);
  }

  /**
   * Compare allocators for equality (same pool = equal).
   */
  template <typename U>
  friend bool operator==(const PoolAllocator& lhs,
                         const PoolAllocator<U>& rhs) noexcept {
    return &lhs.pool() == &rhs.pool();
  }

  /**
   * Access the underlying pool (for statistics and tests).
   */
  const NodePool& pool() const { return *pool_; }

 private:
  std::shared_ptr<NodePool> pool_;

  // Allow rebind to access pool_
  template <typename>
  friend class PoolAllocator;
};

}  // namespace rbmap
