// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "rb_errors.hpp"

namespace rbmap {

// Concept to enforce that a comparator is compatible with a key type
template <typename Key, typename Compare>
concept ComparatorCompatible = requires(Compare comp, Key a, Key b) {
  { comp(a, b) } -> std::convertible_to<bool>;
} && std::is_default_constructible_v<Compare>;

enum class Color : std::uint8_t { Red, Black };

// Grants the test suite read/write access to node links and colors so it can
// corrupt a tree on purpose and check that validate() notices.
struct rb_tree_access;

/**
 * A red-black tree mapping keys to values.
 *
 * Every node carries a color and the tree maintains the red-black properties
 * after each public operation, which bounds the height by 2*log2(n+1). All
 * missing children point at a single per-tree sentinel node. The sentinel is
 * always black, is the parent of the root, and acts as a super-root whose
 * left child is the real root, so rotations and transplants never need to
 * special-case the root or a missing child.
 *
 * Duplicate keys are allowed through insert()/emplace(): a new element goes
 * to the right of every element with an equal key, so the in-order sequence
 * keeps equal keys in insertion order. find(), remove() and
 * insert_or_assign() operate on the most recently inserted equal element.
 *
 * @tparam Key The key type (must be ComparatorCompatible with Compare)
 * @tparam Value The mapped type
 * @tparam Compare The comparison function object type (defaults to
 *         std::less<Key>)
 * @tparam Allocator The allocator type (defaults to std::allocator<value_type>)
 *
 * ## Allocator Rebinding
 *
 * The tree rebinds the provided allocator twice:
 *
 * - `node_alloc_`: rebind_alloc<node> - allocates element nodes
 * - `sentinel_alloc_`: rebind_alloc<node_base> - allocates the sentinel
 *
 * With PoolAllocator each rebind gets its own NodePool, so element nodes are
 * packed densely in their own arena.
 *
 * ## Iterator invalidation
 *
 * Erasing an element with two children moves its in-order successor's pair
 * into the erased element's node and frees the successor's node instead.
 * Iterators to the erased element and to its successor are invalidated;
 * all other iterators stay valid. Insertion invalidates nothing.
 *
 * Not thread-safe: concurrent mutation requires external synchronization.
 */
template <typename Key, typename Value, typename Compare = std::less<Key>,
          typename Allocator = std::allocator<std::pair<Key, Value>>>
  requires ComparatorCompatible<Key, Compare>
class rb_tree {
 public:
  // Type aliases
  using key_type = Key;
  using mapped_type = Value;
  using value_type = std::pair<Key, Value>;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using allocator_type = Allocator;
  using key_compare = Compare;

  /**
   * Links and color shared by element nodes and the sentinel.
   * A default-constructed node_base is a self-linked black sentinel.
   */
  struct node_base {
    node_base* parent;
    node_base* left;
    node_base* right;
    Color color;

    node_base()
        : parent(this), left(this), right(this), color(Color::Black) {}

    node_base(node_base* nil, Color c)
        : parent(nil), left(nil), right(nil), color(c) {}
  };

  /**
   * Element node. New nodes start red with both children and the parent set
   * to the sentinel.
   */
  struct node : node_base {
    value_type data;

    template <typename... Args>
    explicit node(node_base* nil, Args&&... args)
        : node_base(nil, Color::Red), data(std::forward<Args>(args)...) {}
  };

  /**
   * Bidirectional in-order iterator. Walks parent links, so it needs no
   * stack; the sentinel doubles as the end() position.
   */
  template <bool IsConst>
  class basic_iterator {
   public:
    using iterator_category = std::bidirectional_iterator_tag;
    using difference_type = std::ptrdiff_t;
    using value_type = rb_tree::value_type;
    using pointer =
        std::conditional_t<IsConst, const value_type*, value_type*>;
    using reference =
        std::conditional_t<IsConst, const value_type&, value_type&>;

    basic_iterator() : node_(nullptr), nil_(nullptr) {}

    // iterator -> const_iterator
    template <bool OtherConst>
      requires(IsConst && !OtherConst)
    basic_iterator(const basic_iterator<OtherConst>& other)
        : node_(other.node_), nil_(other.nil_) {}

    reference operator*() const {
      assert(node_ != nullptr && node_ != nil_ && "Dereferencing end iterator");
      return as_node(node_)->data;
    }

    pointer operator->() const { return &**this; }

    basic_iterator& operator++() {
      assert(node_ != nullptr && node_ != nil_ && "Incrementing end iterator");
      node_ = next_node(node_, nil_);
      return *this;
    }

    basic_iterator operator++(int) {
      basic_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    basic_iterator& operator--() {
      assert(node_ != nullptr &&
             "Cannot decrement default-constructed iterator");
      node_ = prev_node(node_, nil_);
      return *this;
    }

    basic_iterator operator--(int) {
      basic_iterator tmp = *this;
      --(*this);
      return tmp;
    }

    // operator!= is synthesized; comparing iterator with const_iterator goes
    // through the converting constructor.
    bool operator==(const basic_iterator& other) const {
      return node_ == other.node_;
    }

   private:
    friend class rb_tree;
    template <bool>
    friend class basic_iterator;

    basic_iterator(node_base* node, node_base* nil) : node_(node), nil_(nil) {}

    node_base* node_;
    node_base* nil_;
  };

  using iterator = basic_iterator<false>;
  using const_iterator = basic_iterator<true>;
  using reverse_iterator = std::reverse_iterator<iterator>;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

  /**
   * Default constructor - creates an empty tree (root = sentinel, size 0).
   *
   * @param alloc Allocator to use for node allocation
   */
  explicit rb_tree(const Allocator& alloc = Allocator());

  /**
   * Destructor - deallocates all nodes and the sentinel.
   * Complexity: O(n)
   */
  ~rb_tree();

  /**
   * Copy constructor - creates a deep copy of the tree.
   *
   * Implementation: inserts other's elements in order. Equal keys keep their
   * relative order because each insert lands right of existing equal keys.
   *
   * Complexity: O(m log m) where m = other.size()
   */
  rb_tree(const rb_tree& other);

  /**
   * Copy assignment operator - replaces contents with a deep copy.
   * Complexity: O(n + m log m)
   */
  rb_tree& operator=(const rb_tree& other);

  /**
   * Move constructor - takes ownership of another tree's nodes.
   * Leaves other in a valid but empty state with a fresh sentinel.
   */
  rb_tree(rb_tree&& other);

  /**
   * Move assignment operator - replaces contents by taking ownership.
   * Leaves other in a valid but empty state.
   * Complexity: O(n) where n is this tree's size (due to deallocation)
   */
  rb_tree& operator=(rb_tree&& other);

  /**
   * Constructs the tree from an initializer list.
   * Enables syntax like: rb_tree<int, std::string> tree = {{1, "a"}, {2, "b"}};
   * Complexity: O(n log n)
   */
  rb_tree(std::initializer_list<value_type> init,
          const Allocator& alloc = Allocator());

  /**
   * Constructs the tree from a range of elements.
   * Complexity: O(n log n)
   */
  template <typename InputIt>
  rb_tree(InputIt first, InputIt last, const Allocator& alloc = Allocator());

  /**
   * Returns the number of elements in the tree.
   * Complexity: O(1)
   */
  [[nodiscard]] size_type size() const { return size_; }

  /**
   * Returns true if the tree is empty.
   * Complexity: O(1)
   */
  [[nodiscard]] bool empty() const { return size_ == 0; }

  /**
   * Returns the key comparison object.
   */
  key_compare key_comp() const { return comp_; }

  /**
   * Returns the allocator associated with the container.
   * Note: Returns a copy constructed from node_alloc_ via rebind.
   */
  allocator_type get_allocator() const { return allocator_type(node_alloc_); }

  /**
   * Returns an iterator to the smallest element.
   * Complexity: O(log n)
   */
  iterator begin() { return iterator(minimum(root()), nil_); }
  const_iterator begin() const { return const_iterator(minimum(root()), nil_); }
  const_iterator cbegin() const { return begin(); }

  /**
   * Returns an iterator to one past the largest element (the sentinel).
   * Complexity: O(1)
   */
  iterator end() { return iterator(nil_, nil_); }
  const_iterator end() const { return const_iterator(nil_, nil_); }
  const_iterator cend() const { return end(); }

  reverse_iterator rbegin() { return reverse_iterator(end()); }
  const_reverse_iterator rbegin() const {
    return const_reverse_iterator(end());
  }
  const_reverse_iterator crbegin() const { return rbegin(); }

  reverse_iterator rend() { return reverse_iterator(begin()); }
  const_reverse_iterator rend() const {
    return const_reverse_iterator(begin());
  }
  const_reverse_iterator crend() const { return rend(); }

  /**
   * Finds an element with the given key.
   * If several elements compare equal to key, returns the most recently
   * inserted one (the last of them in order).
   * Returns end() if no element matches.
   * Complexity: O(log n)
   */
  iterator find(const Key& key) {
    return iterator(find_last_equal(key), nil_);
  }
  const_iterator find(const Key& key) const {
    return const_iterator(find_last_equal(key), nil_);
  }

  /**
   * Returns an iterator to the first element not less than the given key.
   * Complexity: O(log n)
   */
  iterator lower_bound(const Key& key) {
    return iterator(lower_bound_node(key), nil_);
  }
  const_iterator lower_bound(const Key& key) const {
    return const_iterator(lower_bound_node(key), nil_);
  }

  /**
   * Returns an iterator to the first element greater than the given key.
   * Complexity: O(log n)
   */
  iterator upper_bound(const Key& key) {
    return iterator(upper_bound_node(key), nil_);
  }
  const_iterator upper_bound(const Key& key) const {
    return const_iterator(upper_bound_node(key), nil_);
  }

  /**
   * Returns {lower_bound(key), upper_bound(key)}.
   * Complexity: O(log n)
   */
  std::pair<iterator, iterator> equal_range(const Key& key) {
    return {lower_bound(key), upper_bound(key)};
  }
  std::pair<const_iterator, const_iterator> equal_range(const Key& key) const {
    return {lower_bound(key), upper_bound(key)};
  }

  /**
   * Returns the number of elements with the given key.
   * Complexity: O(log n + count)
   */
  size_type count(const Key& key) const {
    auto [first, last] = equal_range(key);
    return static_cast<size_type>(std::distance(first, last));
  }

  /**
   * Checks if there is an element with the specified key.
   * Complexity: O(log n)
   */
  bool contains(const Key& key) const { return find_last_equal(key) != nil_; }

  /**
   * Returns a reference to the value of the most recently inserted element
   * with the given key.
   * Throws std::out_of_range if the key does not exist.
   * Complexity: O(log n)
   */
  Value& at(const Key& key);
  const Value& at(const Key& key) const;

  /**
   * Accesses or inserts an element with the specified key.
   * Inserts a default-constructed value only if the key is absent.
   * Complexity: O(log n)
   */
  Value& operator[](const Key& key);

  /**
   * Inserts a key-value pair.
   *
   * Descends as an unbalanced BST would (strictly less goes left, otherwise
   * right), attaches a red node and runs the insert fix-up. An equal key is
   * not rejected: the new element lands right of existing equal keys.
   *
   * @return Iterator to the inserted element
   * Complexity: O(log n)
   */
  iterator insert(const Key& key, const Value& value);

  /**
   * Inserts a key-value pair.
   * Equivalent to insert(value.first, value.second).
   */
  iterator insert(const value_type& value);

  /**
   * Constructs an element in-place. The arguments are forwarded to construct
   * a value_type (std::pair<Key, Value>). Same placement rules as insert().
   * Complexity: O(log n)
   */
  template <typename... Args>
  iterator emplace(Args&&... args);

  /**
   * Inserts a new element or assigns to an existing one.
   * If the key exists, assigns the new value to the most recently inserted
   * equal element. Otherwise inserts a new element.
   *
   * @return Pair of iterator to inserted/updated element and bool indicating
   * insertion (true) vs assignment (false)
   * Complexity: O(log n)
   */
  template <typename M>
  std::pair<iterator, bool> insert_or_assign(const Key& key, M&& value);

  /**
   * Removes the element with the given key and returns it.
   * With duplicate keys, removes the element find(key) would return.
   *
   * @return The removed key-value pair, or std::nullopt if the key is absent
   * (the tree is not modified in that case)
   * Complexity: O(log n)
   */
  std::optional<value_type> remove(const Key& key);

  /**
   * Removes the element with the given key.
   * Returns the number of elements removed (0 or 1).
   * Complexity: O(log n)
   */
  size_type erase(const Key& key);

  /**
   * Removes the element at the given iterator position.
   * Returns an iterator to the element following the erased element.
   *
   * The iterator pos must be valid and dereferenceable (not end()).
   * Complexity: O(log n)
   */
  iterator erase(iterator pos);

  /**
   * Removes elements in the range [first, last).
   * Returns an iterator to the element following the last erased element.
   * Complexity: O(k log n) where k is the number of elements erased
   */
  iterator erase(iterator first, iterator last);

  /**
   * Removes all elements from the tree, leaving it empty.
   * The sentinel remains allocated. All iterators are invalidated.
   * Complexity: O(n)
   */
  void clear();

  /**
   * Swaps the contents (and allocators) of this tree with another tree.
   * Complexity: O(1)
   */
  void swap(rb_tree& other) noexcept;

  /**
   * Materializes the elements in sorted (in-order) order.
   * Complexity: O(n)
   */
  std::vector<value_type> inorder() const;

  /**
   * Materializes the elements node-before-children (pre-order).
   * Complexity: O(n)
   */
  std::vector<value_type> preorder() const;

  /**
   * Materializes the elements children-before-node (post-order).
   * Complexity: O(n)
   */
  std::vector<value_type> postorder() const;

  /**
   * Recomputes black heights and checks every structural rule.
   *
   * @return std::nullopt if the tree is a valid red-black tree, otherwise
   * the first violation found (see rb_violation)
   * Complexity: O(n), no side effects
   */
  std::optional<rb_violation> validate() const;

  /**
   * Returns true if validate() finds no violation.
   */
  bool is_valid() const { return !validate().has_value(); }

  /**
   * Number of black nodes on a path from the root down to a sentinel,
   * excluding the root and including the sentinel. 0 for an empty tree.
   * Derived by the same recursive check as validate().
   *
   * @throws broken_invariant if the tree fails validation
   * Complexity: O(n)
   */
  size_type black_height() const;

  /**
   * Number of nodes on the longest root-to-leaf path. 0 for an empty tree.
   * Complexity: O(n)
   */
  size_type height() const;

  /**
   * Renders the tree as a box-drawing diagram, one node per line:
   *
   *   20B:Root
   *   ├── 10R:L
   *   └── 30R:R
   *
   * Each line holds the key, its color (R/B) and its side (L/R/Root).
   * Requires Key to be streamable. Intended for tests and manual inspection;
   * the layout is not a stable format.
   */
  std::string debug_render() const;

 private:
  friend struct rb_tree_access;

  using node_alloc_type =
      typename std::allocator_traits<Allocator>::template rebind_alloc<node>;
  using node_alloc_traits = std::allocator_traits<node_alloc_type>;
  using sentinel_alloc_type = typename std::allocator_traits<
      Allocator>::template rebind_alloc<node_base>;
  using sentinel_alloc_traits = std::allocator_traits<sentinel_alloc_type>;

  static node* as_node(node_base* n) { return static_cast<node*>(n); }
  static const node* as_node(const node_base* n) {
    return static_cast<const node*>(n);
  }
  static const Key& key_of(const node_base* n) { return as_node(n)->data.first; }

  /**
   * In-order successor of n, or nil if n is the largest element.
   */
  static node_base* next_node(node_base* n, node_base* nil);

  /**
   * In-order predecessor of n. The predecessor of nil is the largest element.
   */
  static node_base* prev_node(node_base* n, node_base* nil);

  node_base* root() const { return nil_->left; }

  // Leftmost/rightmost node of the subtree at n (nil if n is nil)
  node_base* minimum(node_base* n) const;
  node_base* maximum(node_base* n) const;

  node_base* find_last_equal(const Key& key) const;
  node_base* lower_bound_node(const Key& key) const;
  node_base* upper_bound_node(const Key& key) const;

  template <typename... Args>
  node* allocate_node(Args&&... args);
  void deallocate_node(node* n);
  node_base* allocate_sentinel();
  void deallocate_sentinel(node_base* n);

  /**
   * Frees every node of the subtree at n. Leaves links untouched.
   */
  void destroy_subtree(node_base* n);

  /**
   * Rebalancing primitives. rotate_left(x) promotes x->right above x;
   * rotate_right(x) is the mirror image. Both are no-ops when x or the child
   * being promoted is the sentinel. Colors are never changed.
   */
  void rotate_left(node_base* x);
  void rotate_right(node_base* x);

  /**
   * Points parent's link to old_child at new_child instead. parent may be
   * the sentinel, in which case the root is replaced.
   * @throws broken_invariant if parent does not link to old_child
   */
  void replace_child(node_base* parent, node_base* old_child,
                     node_base* new_child);

  /**
   * Replaces the subtree rooted at u with the subtree rooted at v.
   * v->parent is written even when v is the sentinel; delete_fixup relies
   * on it.
   */
  void transplant(node_base* u, node_base* v);

  /**
   * Attaches a freshly allocated red node and restores the red-black
   * properties.
   */
  iterator insert_node(node* z);
  void insert_fixup(node_base* z);

  /**
   * Detaches the element held by z from the tree and rebalances.
   *
   * If z has two children, z's pair is swapped with its in-order successor's
   * and the successor's node is detached instead, so the detached node
   * always has at most one child.
   *
   * @return The detached node, which holds z's original pair. The caller
   * owns it and must deallocate it.
   */
  node* unlink(node_base* z);
  void delete_fixup(node_base* x);

  /**
   * Recursive checker behind validate().
   *
   * @param n Subtree root
   * @param black_height Out: black nodes from n (inclusive) to a sentinel
   * (inclusive)
   * @param count In/out: nodes visited so far
   * @param prev In/out: previously visited node in order (nullptr at start)
   */
  std::optional<rb_violation> validate_subtree(const node_base* n,
                                               size_type& black_height,
                                               size_type& count,
                                               const node_base*& prev) const;

  size_type subtree_height(const node_base* n) const;
  void collect_preorder(const node_base* n,
                        std::vector<value_type>& out) const;
  void collect_postorder(const node_base* n,
                         std::vector<value_type>& out) const;

  // Comparator instance
  [[no_unique_address]] Compare comp_;

  // Allocators must be declared before nil_ so the constructor can allocate
  // the sentinel in its initializer list.
  [[no_unique_address]] node_alloc_type node_alloc_;
  [[no_unique_address]] sentinel_alloc_type sentinel_alloc_;

  // Sentinel: always black. nil_->left is the root; nil_->parent is scratch
  // space written by transplant() during erase.
  node_base* nil_;
  size_type size_;
};

template <typename Key, typename Value, typename Compare, typename Allocator>
void swap(rb_tree<Key, Value, Compare, Allocator>& lhs,
          rb_tree<Key, Value, Compare, Allocator>& rhs) noexcept {
  lhs.swap(rhs);
}

}  // namespace rbmap

// Include implementation
#include "rb_tree.ipp"
