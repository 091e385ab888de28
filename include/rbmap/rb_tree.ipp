// Implementation file for rb_tree.hpp
// This file contains all method implementations for the rb_tree class.

namespace rbmap {

// Constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
rb_tree<Key, Value, Compare, Allocator>::rb_tree(const Allocator& alloc)
    : comp_(),
      node_alloc_(alloc),
      sentinel_alloc_(alloc),
      nil_(allocate_sentinel()),
      size_(0) {}

// Destructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
rb_tree<Key, Value, Compare, Allocator>::~rb_tree() {
  destroy_subtree(root());
  deallocate_sentinel(nil_);
}

// Copy constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
rb_tree<Key, Value, Compare, Allocator>::rb_tree(const rb_tree& other)
    : comp_(other.comp_),
      node_alloc_(node_alloc_traits::select_on_container_copy_construction(
          other.node_alloc_)),
      sentinel_alloc_(
          sentinel_alloc_traits::select_on_container_copy_construction(
              other.sentinel_alloc_)),
      nil_(allocate_sentinel()),
      size_(0) {
  for (const auto& elem : other) {
    insert(elem.first, elem.second);
  }
}

// Copy assignment operator
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
rb_tree<Key, Value, Compare, Allocator>&
rb_tree<Key, Value, Compare, Allocator>::operator=(const rb_tree& other) {
  if (this != &other) {
    clear();
    comp_ = other.comp_;
    for (const auto& elem : other) {
      insert(elem.first, elem.second);
    }
  }
  return *this;
}

// Move constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
rb_tree<Key, Value, Compare, Allocator>::rb_tree(rb_tree&& other)
    : comp_(other.comp_),
      node_alloc_(other.node_alloc_),
      sentinel_alloc_(other.sentinel_alloc_),
      nil_(other.nil_),
      size_(other.size_) {
  // If this throws, other still owns its nodes and ~rb_tree never runs here
  other.nil_ = other.allocate_sentinel();
  other.size_ = 0;
}

// Move assignment operator
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
rb_tree<Key, Value, Compare, Allocator>&
rb_tree<Key, Value, Compare, Allocator>::operator=(rb_tree&& other) {
  if (this != &other) {
    node_base* fresh = other.allocate_sentinel();

    // Release our nodes with the allocators that created them
    destroy_subtree(root());
    deallocate_sentinel(nil_);

    if constexpr (node_alloc_traits::propagate_on_container_move_assignment::
                      value) {
      node_alloc_ = other.node_alloc_;
    }
    if constexpr (sentinel_alloc_traits::
                      propagate_on_container_move_assignment::value) {
      sentinel_alloc_ = other.sentinel_alloc_;
    }
    comp_ = other.comp_;
    nil_ = other.nil_;
    size_ = other.size_;

    other.nil_ = fresh;
    other.size_ = 0;
  }
  return *this;
}

// Initializer list constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
rb_tree<Key, Value, Compare, Allocator>::rb_tree(
    std::initializer_list<value_type> init, const Allocator& alloc)
    : rb_tree(alloc) {
  for (const auto& elem : init) {
    insert(elem.first, elem.second);
  }
}

// Range constructor
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename InputIt>
rb_tree<Key, Value, Compare, Allocator>::rb_tree(InputIt first, InputIt last,
                                                 const Allocator& alloc)
    : rb_tree(alloc) {
  for (auto it = first; it != last; ++it) {
    insert(it->first, it->second);
  }
}

// swap
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::swap(rb_tree& other) noexcept {
  using std::swap;
  swap(comp_, other.comp_);
  swap(node_alloc_, other.node_alloc_);
  swap(sentinel_alloc_, other.sentinel_alloc_);
  swap(nil_, other.nil_);
  swap(size_, other.size_);
}

// next_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::node_base*
rb_tree<Key, Value, Compare, Allocator>::next_node(node_base* n,
                                                   node_base* nil) {
  if (n->right != nil) {
    n = n->right;
    while (n->left != nil) {
      n = n->left;
    }
    return n;
  }

  // Climb while we are a right child. The root's parent is nil, which stops
  // the climb before nil->left (the root) could be mistaken for a left link.
  node_base* p = n->parent;
  while (p != nil && n == p->right) {
    n = p;
    p = p->parent;
  }
  return p;
}

// prev_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::node_base*
rb_tree<Key, Value, Compare, Allocator>::prev_node(node_base* n,
                                                   node_base* nil) {
  // Stepping back from end() lands on the largest element
  if (n == nil) {
    n = nil->left;
    if (n == nil) {
      return nil;
    }
    while (n->right != nil) {
      n = n->right;
    }
    return n;
  }

  if (n->left != nil) {
    n = n->left;
    while (n->right != nil) {
      n = n->right;
    }
    return n;
  }

  node_base* p = n->parent;
  while (p != nil && n == p->left) {
    n = p;
    p = p->parent;
  }
  return p;
}

// minimum
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::node_base*
rb_tree<Key, Value, Compare, Allocator>::minimum(node_base* n) const {
  if (n == nil_) {
    return nil_;
  }
  while (n->left != nil_) {
    n = n->left;
  }
  return n;
}

// maximum
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::node_base*
rb_tree<Key, Value, Compare, Allocator>::maximum(node_base* n) const {
  if (n == nil_) {
    return nil_;
  }
  while (n->right != nil_) {
    n = n->right;
  }
  return n;
}

// find_last_equal
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::node_base*
rb_tree<Key, Value, Compare, Allocator>::find_last_equal(
    const Key& key) const {
  // Same descent as upper_bound, remembering the last equal node passed.
  // The in-order predecessor of the upper bound is always on this path.
  node_base* found = nil_;
  node_base* n = root();
  while (n != nil_) {
    if (comp_(key, key_of(n))) {
      n = n->left;
    } else {
      if (!comp_(key_of(n), key)) {
        found = n;
      }
      n = n->right;
    }
  }
  return found;
}

// lower_bound_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::node_base*
rb_tree<Key, Value, Compare, Allocator>::lower_bound_node(
    const Key& key) const {
  node_base* result = nil_;
  node_base* n = root();
  while (n != nil_) {
    if (!comp_(key_of(n), key)) {
      result = n;
      n = n->left;
    } else {
      n = n->right;
    }
  }
  return result;
}

// upper_bound_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::node_base*
rb_tree<Key, Value, Compare, Allocator>::upper_bound_node(
    const Key& key) const {
  node_base* result = nil_;
  node_base* n = root();
  while (n != nil_) {
    if (comp_(key, key_of(n))) {
      result = n;
      n = n->left;
    } else {
      n = n->right;
    }
  }
  return result;
}

// at (non-const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
Value& rb_tree<Key, Value, Compare, Allocator>::at(const Key& key) {
  node_base* n = find_last_equal(key);
  if (n == nil_) {
    throw std::out_of_range("rb_tree::at: key not found");
  }
  return as_node(n)->data.second;
}

// at (const)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
const Value& rb_tree<Key, Value, Compare, Allocator>::at(
    const Key& key) const {
  const node_base* n = find_last_equal(key);
  if (n == nil_) {
    throw std::out_of_range("rb_tree::at: key not found");
  }
  return as_node(n)->data.second;
}

// operator[]
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
Value& rb_tree<Key, Value, Compare, Allocator>::operator[](const Key& key) {
  node_base* n = find_last_equal(key);
  if (n != nil_) {
    return as_node(n)->data.second;
  }
  return emplace(key, Value{})->second;
}

// insert
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::iterator
rb_tree<Key, Value, Compare, Allocator>::insert(const Key& key,
                                                const Value& value) {
  return emplace(key, value);
}

// insert(value_type)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::iterator
rb_tree<Key, Value, Compare, Allocator>::insert(const value_type& value) {
  return emplace(value);
}

// emplace
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename... Args>
typename rb_tree<Key, Value, Compare, Allocator>::iterator
rb_tree<Key, Value, Compare, Allocator>::emplace(Args&&... args) {
  return insert_node(allocate_node(std::forward<Args>(args)...));
}

// insert_or_assign
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename M>
std::pair<typename rb_tree<Key, Value, Compare, Allocator>::iterator, bool>
rb_tree<Key, Value, Compare, Allocator>::insert_or_assign(const Key& key,
                                                          M&& value) {
  node_base* n = find_last_equal(key);
  if (n != nil_) {
    as_node(n)->data.second = std::forward<M>(value);
    return {iterator(n, nil_), false};
  }
  return {emplace(key, std::forward<M>(value)), true};
}

// insert_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::iterator
rb_tree<Key, Value, Compare, Allocator>::insert_node(node* z) {
  // Unbalanced BST descent: strictly less goes left, otherwise right
  node_base* y = nil_;
  node_base* x = root();
  const Key& key = z->data.first;
  while (x != nil_) {
    y = x;
    x = comp_(key, key_of(x)) ? x->left : x->right;
  }

  z->parent = y;
  z->left = nil_;
  z->right = nil_;
  ++size_;

  if (y == nil_) {
    // Empty tree: the new node is the root and is black; nothing to fix
    nil_->left = z;
    z->color = Color::Black;
    return iterator(z, nil_);
  }

  if (comp_(key, key_of(y))) {
    y->left = z;
  } else {
    y->right = z;
  }

  insert_fixup(z);
  return iterator(z, nil_);
}

// insert_fixup
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::insert_fixup(node_base* z) {
  // z is red. The only property that can be broken is "no red node has a
  // red child", between z and its parent. The root's parent is the black
  // sentinel, so the loop stops once z reaches the root.
  while (z->parent->color == Color::Red) {
    node_base* parent = z->parent;
    node_base* grandparent = parent->parent;
    if (grandparent == nil_) {
      throw broken_invariant("red node's parent is a red root");
    }

    if (parent == grandparent->left) {
      node_base* uncle = grandparent->right;
      if (uncle->color == Color::Red) {
        // Case 1: recolor and continue from the grandparent
        parent->color = Color::Black;
        uncle->color = Color::Black;
        grandparent->color = Color::Red;
        z = grandparent;
        continue;
      }
      if (z == parent->right) {
        // Case 2: inner grandchild, rotate into case 3
        z = parent;
        rotate_left(z);
        parent = z->parent;
      }
      // Case 3: outer grandchild
      parent->color = Color::Black;
      grandparent->color = Color::Red;
      rotate_right(grandparent);
    } else {
      node_base* uncle = grandparent->left;
      if (uncle->color == Color::Red) {
        parent->color = Color::Black;
        uncle->color = Color::Black;
        grandparent->color = Color::Red;
        z = grandparent;
        continue;
      }
      if (z == parent->left) {
        z = parent;
        rotate_right(z);
        parent = z->parent;
      }
      parent->color = Color::Black;
      grandparent->color = Color::Red;
      rotate_left(grandparent);
    }
  }

  root()->color = Color::Black;
}

// rotate_left
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::rotate_left(node_base* x) {
  if (x == nil_ || x->right == nil_) {
    return;
  }

  node_base* y = x->right;

  // Relink x's parent first: it is the only step that can fail
  replace_child(x->parent, x, y);
  y->parent = x->parent;

  x->right = y->left;
  if (y->left != nil_) {
    y->left->parent = x;
  }

  y->left = x;
  x->parent = y;
}

// rotate_right
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::rotate_right(node_base* x) {
  if (x == nil_ || x->left == nil_) {
    return;
  }

  node_base* y = x->left;

  replace_child(x->parent, x, y);
  y->parent = x->parent;

  x->left = y->right;
  if (y->right != nil_) {
    y->right->parent = x;
  }

  y->right = x;
  x->parent = y;
}

// replace_child
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::replace_child(
    node_base* parent, node_base* old_child, node_base* new_child) {
  // The root hangs off nil_->left, so no root special case is needed
  if (parent->left == old_child) {
    parent->left = new_child;
  } else if (parent->right == old_child) {
    parent->right = new_child;
  } else {
    throw broken_invariant("parent does not link to its child");
  }
}

// transplant
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::transplant(node_base* u,
                                                         node_base* v) {
  replace_child(u->parent, u, v);
  v->parent = u->parent;
}

// remove
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<typename rb_tree<Key, Value, Compare, Allocator>::value_type>
rb_tree<Key, Value, Compare, Allocator>::remove(const Key& key) {
  node_base* z = find_last_equal(key);
  if (z == nil_) {
    return std::nullopt;
  }

  node* removed = unlink(z);
  std::optional<value_type> result;
  try {
    result.emplace(std::move(removed->data));
  } catch (...) {
    deallocate_node(removed);
    throw;
  }
  deallocate_node(removed);
  return result;
}

// erase (by key)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::size_type
rb_tree<Key, Value, Compare, Allocator>::erase(const Key& key) {
  node_base* z = find_last_equal(key);
  if (z == nil_) {
    return 0;
  }
  deallocate_node(unlink(z));
  return 1;
}

// erase (by iterator)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::iterator
rb_tree<Key, Value, Compare, Allocator>::erase(iterator pos) {
  assert(pos.node_ != nil_ && "Cannot erase end iterator");

  node_base* z = pos.node_;

  // With two children, z receives its successor's pair and stays in the
  // tree, so z itself is the next position. Otherwise the successor node is
  // untouched by the unlink and can be computed up front.
  node_base* next =
      (z->left != nil_ && z->right != nil_) ? z : next_node(z, nil_);

  deallocate_node(unlink(z));
  return iterator(next, nil_);
}

// erase (range)
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::iterator
rb_tree<Key, Value, Compare, Allocator>::erase(iterator first, iterator last) {
  // Count up front: erasing may free the node `last` points at (when it is
  // the successor of a two-child node), but erase(pos) always returns the
  // correct next position.
  auto remaining = std::distance(first, last);
  while (remaining-- > 0) {
    first = erase(first);
  }
  return first;
}

// unlink
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::node*
rb_tree<Key, Value, Compare, Allocator>::unlink(node_base* z) {
  if (z->left != nil_ && z->right != nil_) {
    node_base* successor = minimum(z->right);
    using std::swap;
    swap(as_node(z)->data, as_node(successor)->data);
    z = successor;
  }

  // z has at most one child now
  node_base* x = (z->left != nil_) ? z->left : z->right;
  const Color removed_color = z->color;

  transplant(z, x);
  --size_;

  if (removed_color == Color::Black) {
    try {
      delete_fixup(x);
    } catch (...) {
      // z is already out of the tree; the caller never sees it
      deallocate_node(as_node(z));
      throw;
    }
  }

  z->parent = nil_;
  z->left = nil_;
  z->right = nil_;
  return as_node(z);
}

// delete_fixup
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::delete_fixup(node_base* x) {
  // x carries an extra black. x may be the sentinel, whose parent was set by
  // transplant(). A red x absorbs the extra black by being painted black.
  while (x != root() && x->color == Color::Black) {
    node_base* parent = x->parent;

    if (x == parent->left) {
      node_base* w = parent->right;
      if (w == nil_) {
        throw broken_invariant("doubly black node has no sibling");
      }

      if (w->color == Color::Red) {
        // Case 1: red sibling, rotate to get a black one
        w->color = Color::Black;
        parent->color = Color::Red;
        rotate_left(parent);
        w = parent->right;
        if (w == nil_) {
          throw broken_invariant("doubly black node has no sibling");
        }
      }

      if (w->left->color == Color::Black && w->right->color == Color::Black) {
        // Case 2: push the extra black up
        w->color = Color::Red;
        x = parent;
      } else {
        if (w->right->color == Color::Black) {
          // Case 3: near child red, far child black
          w->left->color = Color::Black;
          w->color = Color::Red;
          rotate_right(w);
          w = parent->right;
        }
        // Case 4: far child red
        w->color = parent->color;
        parent->color = Color::Black;
        w->right->color = Color::Black;
        rotate_left(parent);
        x = root();
      }
    } else {
      node_base* w = parent->left;
      if (w == nil_) {
        throw broken_invariant("doubly black node has no sibling");
      }

      if (w->color == Color::Red) {
        w->color = Color::Black;
        parent->color = Color::Red;
        rotate_right(parent);
        w = parent->left;
        if (w == nil_) {
          throw broken_invariant("doubly black node has no sibling");
        }
      }

      if (w->right->color == Color::Black && w->left->color == Color::Black) {
        w->color = Color::Red;
        x = parent;
      } else {
        if (w->left->color == Color::Black) {
          w->right->color = Color::Black;
          w->color = Color::Red;
          rotate_left(w);
          w = parent->left;
        }
        w->color = parent->color;
        parent->color = Color::Black;
        w->left->color = Color::Black;
        rotate_right(parent);
        x = root();
      }
    }
  }

  x->color = Color::Black;
}

// clear
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::clear() {
  destroy_subtree(root());
  nil_->parent = nil_;
  nil_->left = nil_;
  nil_->right = nil_;
  size_ = 0;
}

// destroy_subtree
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::destroy_subtree(node_base* n) {
  // Recurse right, loop left: depth is bounded by the tree height
  while (n != nil_) {
    destroy_subtree(n->right);
    node_base* left = n->left;
    deallocate_node(as_node(n));
    n = left;
  }
}

// allocate_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
template <typename... Args>
typename rb_tree<Key, Value, Compare, Allocator>::node*
rb_tree<Key, Value, Compare, Allocator>::allocate_node(Args&&... args) {
  node* n = node_alloc_traits::allocate(node_alloc_, 1);
  try {
    node_alloc_traits::construct(node_alloc_, n, nil_,
                                 std::forward<Args>(args)...);
  } catch (...) {
    node_alloc_traits::deallocate(node_alloc_, n, 1);
    throw;
  }
  return n;
}

// deallocate_node
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::deallocate_node(node* n) {
  node_alloc_traits::destroy(node_alloc_, n);
  node_alloc_traits::deallocate(node_alloc_, n, 1);
}

// allocate_sentinel
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::node_base*
rb_tree<Key, Value, Compare, Allocator>::allocate_sentinel() {
  node_base* n = sentinel_alloc_traits::allocate(sentinel_alloc_, 1);
  sentinel_alloc_traits::construct(sentinel_alloc_, n);
  return n;
}

// deallocate_sentinel
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::deallocate_sentinel(
    node_base* n) {
  sentinel_alloc_traits::destroy(sentinel_alloc_, n);
  sentinel_alloc_traits::deallocate(sentinel_alloc_, n, 1);
}

// inorder
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<typename rb_tree<Key, Value, Compare, Allocator>::value_type>
rb_tree<Key, Value, Compare, Allocator>::inorder() const {
  std::vector<value_type> out;
  out.reserve(size_);
  for (const auto& elem : *this) {
    out.push_back(elem);
  }
  return out;
}

// preorder
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<typename rb_tree<Key, Value, Compare, Allocator>::value_type>
rb_tree<Key, Value, Compare, Allocator>::preorder() const {
  std::vector<value_type> out;
  out.reserve(size_);
  collect_preorder(root(), out);
  return out;
}

// postorder
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::vector<typename rb_tree<Key, Value, Compare, Allocator>::value_type>
rb_tree<Key, Value, Compare, Allocator>::postorder() const {
  std::vector<value_type> out;
  out.reserve(size_);
  collect_postorder(root(), out);
  return out;
}

// collect_preorder
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::collect_preorder(
    const node_base* n, std::vector<value_type>& out) const {
  if (n == nil_) {
    return;
  }
  out.push_back(as_node(n)->data);
  collect_preorder(n->left, out);
  collect_preorder(n->right, out);
}

// collect_postorder
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
void rb_tree<Key, Value, Compare, Allocator>::collect_postorder(
    const node_base* n, std::vector<value_type>& out) const {
  if (n == nil_) {
    return;
  }
  collect_postorder(n->left, out);
  collect_postorder(n->right, out);
  out.push_back(as_node(n)->data);
}

// validate
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<rb_violation> rb_tree<Key, Value, Compare, Allocator>::validate()
    const {
  if (nil_->color != Color::Black) {
    return rb_violation::red_sentinel;
  }

  const node_base* r = root();
  if (r != nil_) {
    if (r->color != Color::Red && r->color != Color::Black) {
      return rb_violation::invalid_color;
    }
    if (r->color == Color::Red) {
      return rb_violation::red_root;
    }
    if (r->parent != nil_) {
      return rb_violation::broken_parent_link;
    }
  }

  size_type black_height = 0;
  size_type count = 0;
  const node_base* prev = nullptr;
  if (auto violation = validate_subtree(r, black_height, count, prev)) {
    return violation;
  }

  if (count != size_) {
    return rb_violation::size_mismatch;
  }
  return std::nullopt;
}

// validate_subtree
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::optional<rb_violation>
rb_tree<Key, Value, Compare, Allocator>::validate_subtree(
    const node_base* n, size_type& black_height, size_type& count,
    const node_base*& prev) const {
  if (n == nil_) {
    // The sentinel counts as one black node at every leaf
    black_height = 1;
    return std::nullopt;
  }

  if (n->color != Color::Red && n->color != Color::Black) {
    return rb_violation::invalid_color;
  }
  if (n->color == Color::Red &&
      (n->left->color == Color::Red || n->right->color == Color::Red)) {
    return rb_violation::red_red;
  }
  if ((n->left != nil_ && n->left->parent != n) ||
      (n->right != nil_ && n->right->parent != n)) {
    return rb_violation::broken_parent_link;
  }

  size_type left_height = 0;
  if (auto violation = validate_subtree(n->left, left_height, count, prev)) {
    return violation;
  }

  if (prev != nullptr && comp_(key_of(n), key_of(prev))) {
    return rb_violation::out_of_order;
  }
  prev = n;
  ++count;

  size_type right_height = 0;
  if (auto violation = validate_subtree(n->right, right_height, count, prev)) {
    return violation;
  }

  if (left_height != right_height) {
    return rb_violation::black_height_mismatch;
  }

  black_height = left_height + (n->color == Color::Black ? 1 : 0);
  return std::nullopt;
}

// black_height
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::size_type
rb_tree<Key, Value, Compare, Allocator>::black_height() const {
  const node_base* r = root();
  if (r == nil_) {
    return 0;
  }

  // The validator derives the height of every subtree; the root's own color
  // is not counted
  size_type height = 0;
  size_type count = 0;
  const node_base* prev = nullptr;
  if (auto violation = validate_subtree(r, height, count, prev)) {
    throw broken_invariant(std::string(to_string(*violation)));
  }
  return r->color == Color::Black ? height - 1 : height;
}

// height
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::size_type
rb_tree<Key, Value, Compare, Allocator>::height() const {
  return subtree_height(root());
}

// subtree_height
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
typename rb_tree<Key, Value, Compare, Allocator>::size_type
rb_tree<Key, Value, Compare, Allocator>::subtree_height(
    const node_base* n) const {
  if (n == nil_) {
    return 0;
  }
  return 1 + std::max(subtree_height(n->left), subtree_height(n->right));
}

// debug_render
template <typename Key, typename Value, typename Compare, typename Allocator>
  requires ComparatorCompatible<Key, Compare>
std::string rb_tree<Key, Value, Compare, Allocator>::debug_render() const {
  std::ostringstream out;
  const node_base* r = root();
  if (r == nil_) {
    return out.str();
  }

  auto color_tag = [](const node_base* n) {
    return n->color == Color::Red ? "R" : "B";
  };

  out << key_of(r) << color_tag(r) << ":Root\n";

  auto render = [&](auto& self, const node_base* parent,
                    const std::string& padding) -> void {
    const node_base* children[] = {parent->left, parent->right};
    for (int i = 0; i < 2; ++i) {
      const node_base* child = children[i];
      if (child == nil_) {
        continue;
      }
      // The left child only gets a tee when a right sibling follows
      const bool last = i == 1 || parent->right == nil_;
      out << padding << (last ? "└── " : "├── ") << key_of(child)
          << color_tag(child) << (i == 0 ? ":L" : ":R") << '\n';
      self(self, child, padding + (last ? "    " : "│   "));
    }
  };
  render(render, r, "");

  return out.str();
}

}  // namespace rbmap
