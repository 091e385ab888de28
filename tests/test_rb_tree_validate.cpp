// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <rbmap/rb_errors.hpp>
#include <rbmap/rb_tree.hpp>
#include <string>

namespace rbmap {

// Reaches into the tree so tests can break it on purpose.
struct rb_tree_access {
  template <typename Tree>
  static typename Tree::node_base* root(Tree& tree) {
    return tree.root();
  }

  template <typename Tree>
  static typename Tree::node_base* sentinel(Tree& tree) {
    return tree.nil_;
  }

  template <typename Tree>
  static void set_size(Tree& tree, typename Tree::size_type size) {
    tree.size_ = size;
  }

  template <typename Tree>
  static void set_key(typename Tree::node_base* n, int key) {
    static_cast<typename Tree::node*>(n)->data.first = key;
  }
};

}  // namespace rbmap

using namespace rbmap;
using Tree = rb_tree<int, int>;
using tree_access = rb_tree_access;

namespace {

// Live allocations across every rebind, so the sentinel counts too
int live_allocations = 0;

template <typename T>
struct CountingAllocator {
  using value_type = T;

  CountingAllocator() = default;
  template <typename U>
  CountingAllocator(const CountingAllocator<U>&) {}

  T* allocate(std::size_t n) {
    ++live_allocations;
    return std::allocator<T>().allocate(n);
  }

  void deallocate(T* p, std::size_t n) {
    --live_allocations;
    std::allocator<T>().deallocate(p, n);
  }

  template <typename U>
  bool operator==(const CountingAllocator<U>&) const {
    return true;
  }
};

// 20B(10R, 30R)
Tree make_small_tree() {
  Tree tree;
  for (int key : {20, 10, 30}) {
    tree.insert(key, key);
  }
  return tree;
}

}  // namespace

TEST_CASE("validate accepts well-formed trees", "[rb_tree][validate]") {
  Tree empty;
  REQUIRE_FALSE(empty.validate().has_value());

  Tree tree = make_small_tree();
  REQUIRE_FALSE(tree.validate().has_value());
  REQUIRE(tree.is_valid());
}

TEST_CASE("validate detects each broken property", "[rb_tree][validate]") {
  Tree tree = make_small_tree();
  auto* root = tree_access::root(tree);

  SECTION("Red root") {
    root->color = Color::Red;
    REQUIRE(tree.validate() == rb_violation::red_root);
    REQUIRE_FALSE(tree.is_valid());
  }

  SECTION("Red sentinel") {
    tree_access::sentinel(tree)->color = Color::Red;
    REQUIRE(tree.validate() == rb_violation::red_sentinel);
  }

  SECTION("Color outside red and black") {
    root->left->color = static_cast<Color>(7);
    REQUIRE(tree.validate() == rb_violation::invalid_color);
  }

  SECTION("Red node with a red child") {
    // 20B(10B, 30B(-, 40R)), then paint 30 red
    tree.insert(40, 40);
    REQUIRE(tree.is_valid());
    tree_access::root(tree)->right->color = Color::Red;
    REQUIRE(tree.validate() == rb_violation::red_red);
  }

  SECTION("Unequal black heights") {
    root->left->color = Color::Black;
    REQUIRE(tree.validate() == rb_violation::black_height_mismatch);
  }

  SECTION("Child whose parent link points elsewhere") {
    root->left->parent = root->right;
    REQUIRE(tree.validate() == rb_violation::broken_parent_link);
  }

  SECTION("Keys out of order") {
    tree_access::set_key<Tree>(root->left, 99);
    REQUIRE(tree.validate() == rb_violation::out_of_order);
  }

  SECTION("Size disagrees with node count") {
    tree_access::set_size(tree, 5);
    REQUIRE(tree.validate() == rb_violation::size_mismatch);
  }
}

TEST_CASE("violations have descriptive messages", "[rb_tree][validate]") {
  REQUIRE(to_string(rb_violation::red_root) ==
          "red-black property 2 violated: root is red");
  REQUIRE(to_string(rb_violation::red_red) ==
          "red-black property 3 violated: red node has a red child");
  REQUIRE(to_string(rb_violation::black_height_mismatch) ==
          "red-black property 4 violated: black heights differ");
  REQUIRE(to_string(rb_violation::size_mismatch) ==
          "node count does not match size()");
}

TEST_CASE("operations throw broken_invariant on corrupted links",
          "[rb_tree][validate]") {
  SECTION("Removing a node whose parent does not link to it") {
    Tree tree = make_small_tree();
    auto* root = tree_access::root(tree);
    root->left->parent = root->right;

    REQUIRE_THROWS_AS(tree.remove(10), broken_invariant);
  }

  SECTION("Insert fixup finding a red node with no grandparent") {
    // 10B(-, 20R), then detach 20's parent link
    Tree tree;
    tree.insert(10, 10);
    tree.insert(20, 20);
    tree_access::root(tree)->right->parent = tree_access::sentinel(tree);

    REQUIRE_THROWS_AS(tree.insert(30, 30), broken_invariant);
  }

  SECTION("Delete fix-up finding a doubly black node with no sibling") {
    // 10B(-, 20R), then paint 20 black so removing it leaves a deficit
    Tree tree;
    tree.insert(10, 10);
    tree.insert(20, 20);
    tree_access::root(tree)->right->color = Color::Black;

    REQUIRE_THROWS_AS(tree.remove(20), broken_invariant);
  }

  SECTION("Failed removal releases the detached node") {
    live_allocations = 0;
    {
      rb_tree<int, int, std::less<int>,
              CountingAllocator<std::pair<int, int>>>
          tree;
      tree.insert(10, 10);
      tree.insert(20, 20);
      REQUIRE(live_allocations == 3);  // two nodes and the sentinel

      tree_access::root(tree)->right->color = Color::Black;
      REQUIRE_THROWS_AS(tree.remove(20), broken_invariant);
      REQUIRE(live_allocations == 2);
    }
    REQUIRE(live_allocations == 0);
  }

  SECTION("black_height refuses a tree that fails validation") {
    Tree tree = make_small_tree();
    REQUIRE(tree.black_height() == 1);

    tree_access::root(tree)->left->color = Color::Black;
    REQUIRE_THROWS_AS(tree.black_height(), broken_invariant);
  }

  SECTION("Message carries the library prefix") {
    broken_invariant error("test");
    REQUIRE(std::string(error.what()) == "rb_tree: broken invariant: test");
  }
}
