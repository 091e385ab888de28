// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <algorithm>
#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <iterator>
#include <map>
#include <random>
#include <rbmap/pool_allocator.hpp>
#include <rbmap/rb_tree.hpp>
#include <vector>

using namespace rbmap;

using StdAlloc = std::allocator<std::pair<int, int>>;
using PoolAlloc = PoolAllocator<std::pair<int, int>>;

template <typename Alloc>
using IntTree = rb_tree<int, int, std::less<int>, Alloc>;

namespace {

template <typename Tree>
std::vector<int> inorder_keys(const Tree& tree) {
  std::vector<int> keys;
  for (const auto& [key, value] : tree.inorder()) {
    keys.push_back(key);
  }
  return keys;
}

template <typename Tree>
void verify_against(const Tree& tree, const std::multimap<int, int>& ref) {
  REQUIRE(tree.is_valid());
  REQUIRE(tree.size() == ref.size());
  REQUIRE(std::equal(tree.begin(), tree.end(), ref.begin(), ref.end(),
                     [](const auto& a, const auto& b) {
                       return a.first == b.first && a.second == b.second;
                     }));
}

}  // namespace

TEMPLATE_TEST_CASE("rb_tree remove operations", "[rb_tree][remove]", StdAlloc,
                   PoolAlloc) {
  using Tree = IntTree<TestType>;

  SECTION("Remove the only element") {
    Tree tree;
    tree.insert(1, 100);
    auto removed = tree.remove(1);
    REQUIRE(removed.has_value());
    REQUIRE(removed->first == 1);
    REQUIRE(removed->second == 100);
    REQUIRE(tree.empty());
    REQUIRE(tree.begin() == tree.end());
    REQUIRE(tree.is_valid());
  }

  SECTION("Remove a red leaf needs no fixup") {
    Tree tree;
    for (int key : {20, 10, 30}) {
      tree.insert(key, key);
    }
    REQUIRE(tree.remove(10).has_value());
    REQUIRE(tree.debug_render() ==
            "20B:Root\n"
            "└── 30R:R\n");
    REQUIRE(tree.is_valid());
  }

  SECTION("Remove the root with two children") {
    // 8B(4B(2R,6R),12B(10R,14R))
    Tree tree;
    for (int key : {8, 4, 12, 2, 6, 10, 14}) {
      tree.insert(key, key * 10);
    }
    REQUIRE(tree.preorder().front().first == 8);

    auto removed = tree.remove(8);
    REQUIRE(removed.has_value());
    REQUIRE(removed->first == 8);
    REQUIRE(removed->second == 80);

    REQUIRE(tree.is_valid());
    REQUIRE(inorder_keys(tree) == std::vector<int>{2, 4, 6, 10, 12, 14});
    // The in-order successor takes the root's place
    REQUIRE(tree.preorder().front().first == 10);
    REQUIRE(tree.at(10) == 100);
  }

  SECTION("Remove an interior node from an ascending build") {
    Tree tree;
    for (int key = 2; key <= 14; key += 2) {
      tree.insert(key, key);
    }
    REQUIRE(tree.remove(8).has_value());
    REQUIRE(tree.is_valid());
    REQUIRE(inorder_keys(tree) == std::vector<int>{2, 4, 6, 10, 12, 14});
  }

  SECTION("Remove a missing key leaves the tree untouched") {
    Tree tree;
    for (int key : {5, 3, 8, 1, 4}) {
      tree.insert(key, key);
    }
    const auto before = tree.inorder();
    const auto shape = tree.debug_render();

    REQUIRE_FALSE(tree.remove(42).has_value());
    REQUIRE_FALSE(tree.remove(0).has_value());
    REQUIRE(tree.inorder() == before);
    REQUIRE(tree.debug_render() == shape);
    REQUIRE(tree.size() == 5);
    REQUIRE(tree.is_valid());
  }

  SECTION("Red sibling rotates before recoloring") {
    // 10B(5B, 20R(15B, 25B(-, 30R))): removing 5 leaves x with a red sibling
    Tree tree;
    for (int key : {10, 5, 20, 15, 25, 30}) {
      tree.insert(key, key);
    }
    REQUIRE(tree.remove(5).has_value());

    REQUIRE(tree.debug_render() ==
            "20B:Root\n"
            "├── 10B:L\n"
            "│   └── 15R:R\n"
            "└── 25B:R\n"
            "    └── 30R:R\n");
    REQUIRE(tree.is_valid());
  }

  SECTION("Red sibling on the left mirrors the rotation") {
    // 20B(10R(5B(1R, -), 15B), 25B): removing 25 leaves x with a red sibling
    Tree tree;
    for (int key : {20, 25, 10, 15, 5, 1}) {
      tree.insert(key, key);
    }
    REQUIRE(tree.remove(25).has_value());

    REQUIRE(tree.debug_render() ==
            "10B:Root\n"
            "├── 5B:L\n"
            "│   └── 1R:L\n"
            "└── 20B:R\n"
            "    └── 15R:L\n");
    REQUIRE(tree.is_valid());
  }

  SECTION("Black sibling with black children pushes the deficit up") {
    // 10B(5B, 20B)
    Tree tree;
    for (int key : {10, 5, 20, 30}) {
      tree.insert(key, key);
    }
    REQUIRE(tree.remove(30).has_value());
    REQUIRE(tree.remove(5).has_value());

    REQUIRE(tree.debug_render() ==
            "10B:Root\n"
            "└── 20R:R\n");
    REQUIRE(tree.is_valid());
  }

  SECTION("Near nephew red rotates the sibling first") {
    // 10B(5B, 20B(15R, -))
    Tree tree;
    for (int key : {10, 5, 20, 15}) {
      tree.insert(key, key);
    }
    REQUIRE(tree.remove(5).has_value());

    REQUIRE(tree.debug_render() ==
            "15B:Root\n"
            "├── 10B:L\n"
            "└── 20B:R\n");
    REQUIRE(tree.is_valid());
  }

  SECTION("Far nephew red finishes with one rotation") {
    // 10B(5B, 20B(-, 30R))
    Tree tree;
    for (int key : {10, 5, 20, 30}) {
      tree.insert(key, key);
    }
    REQUIRE(tree.remove(5).has_value());

    REQUIRE(tree.debug_render() ==
            "20B:Root\n"
            "├── 10B:L\n"
            "└── 30B:R\n");
    REQUIRE(tree.is_valid());
  }

  SECTION("Far nephew red on the left mirrors the rotation") {
    // 10B(5B(1R, -), 20B)
    Tree tree;
    for (int key : {10, 5, 20, 1}) {
      tree.insert(key, key);
    }
    REQUIRE(tree.remove(20).has_value());

    REQUIRE(tree.debug_render() ==
            "5B:Root\n"
            "├── 1B:L\n"
            "└── 10B:R\n");
    REQUIRE(tree.is_valid());
  }

  SECTION("Remove from an empty tree") {
    Tree tree;
    REQUIRE_FALSE(tree.remove(1).has_value());
    REQUIRE(tree.is_valid());
  }

  SECTION("Remove takes the newest of several equal keys") {
    Tree tree;
    for (int i = 0; i < 4; ++i) {
      tree.insert(7, i);
    }
    tree.insert(6, 0);
    tree.insert(8, 0);

    REQUIRE(tree.remove(7)->second == 3);
    REQUIRE(tree.remove(7)->second == 2);
    REQUIRE(tree.count(7) == 2);
    REQUIRE(tree.find(7)->second == 1);
    REQUIRE(tree.is_valid());
  }

  SECTION("Insert 1..5000 shuffled then remove all") {
    std::vector<int> keys(5000);
    for (int i = 0; i < 5000; ++i) {
      keys[i] = i + 1;
    }
    std::mt19937 rng(12345);
    std::shuffle(keys.begin(), keys.end(), rng);

    Tree tree;
    for (int key : keys) {
      tree.insert(key, key);
    }
    REQUIRE(tree.size() == 5000);
    REQUIRE(tree.is_valid());

    std::shuffle(keys.begin(), keys.end(), rng);
    for (size_t i = 0; i < keys.size(); ++i) {
      auto removed = tree.remove(keys[i]);
      REQUIRE(removed.has_value());
      REQUIRE(removed->first == keys[i]);
      if (i % 97 == 0) {
        REQUIRE(tree.is_valid());
      }
    }

    REQUIRE(tree.empty());
    REQUIRE(tree.size() == 0);
    REQUIRE(tree.begin() == tree.end());
    REQUIRE(tree.height() == 0);
    REQUIRE(tree.black_height() == 0);
    REQUIRE(tree.is_valid());
  }
}

TEMPLATE_TEST_CASE("rb_tree erase operations", "[rb_tree][erase]", StdAlloc,
                   PoolAlloc) {
  using Tree = IntTree<TestType>;
  Tree tree;
  for (int i = 0; i < 64; ++i) {
    tree.insert(i, i);
  }

  SECTION("Erase by key returns the number removed") {
    REQUIRE(tree.erase(10) == 1);
    REQUIRE(tree.erase(10) == 0);
    REQUIRE(tree.size() == 63);
    REQUIRE(tree.is_valid());
  }

  SECTION("Erase by iterator returns the following element") {
    auto it = tree.find(20);
    auto next = tree.erase(it);
    REQUIRE(next != tree.end());
    REQUIRE(next->first == 21);
    REQUIRE_FALSE(tree.contains(20));
    REQUIRE(tree.is_valid());
  }

  SECTION("Erase the last element returns end()") {
    auto last = std::prev(tree.end());
    REQUIRE(tree.erase(last) == tree.end());
    REQUIRE(tree.rbegin()->first == 62);
  }

  SECTION("Erase every other element while iterating") {
    auto it = tree.begin();
    while (it != tree.end()) {
      if (it->first % 2 == 0) {
        it = tree.erase(it);
      } else {
        ++it;
      }
    }
    REQUIRE(tree.size() == 32);
    REQUIRE(tree.is_valid());
    for (const auto& [key, value] : tree) {
      REQUIRE(key % 2 == 1);
      REQUIRE(value == key);
    }
  }

  SECTION("Erase a range") {
    auto first = tree.lower_bound(16);
    auto last = tree.lower_bound(48);
    auto result = tree.erase(first, last);
    REQUIRE(result->first == 48);
    REQUIRE(tree.size() == 32);
    REQUIRE(tree.lower_bound(16)->first == 48);
    REQUIRE(tree.is_valid());
  }

  SECTION("Erase the whole range") {
    REQUIRE(tree.erase(tree.begin(), tree.end()) == tree.end());
    REQUIRE(tree.empty());
    REQUIRE(tree.is_valid());
  }
}

TEMPLATE_TEST_CASE("rb_tree randomized operations match std::multimap",
                   "[rb_tree][random]", StdAlloc, PoolAlloc) {
  using Tree = IntTree<TestType>;

  for (unsigned seed : {1u, 7u, 2024u}) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> key_dist(0, 200);
    std::uniform_int_distribution<int> op_dist(0, 99);

    Tree tree;
    std::multimap<int, int> ref;

    for (int step = 0; step < 3000; ++step) {
      const int key = key_dist(rng);
      const int op = op_dist(rng);

      if (op < 55) {
        tree.insert(key, step);
        ref.emplace(key, step);
      } else if (op < 90) {
        auto removed = tree.remove(key);
        auto upper = ref.upper_bound(key);
        if (upper == ref.begin() || std::prev(upper)->first != key) {
          REQUIRE_FALSE(removed.has_value());
        } else {
          // Both containers keep equal keys in insertion order, so the
          // newest one is just before upper_bound
          auto newest = std::prev(upper);
          REQUIRE(removed.has_value());
          REQUIRE(removed->second == newest->second);
          ref.erase(newest);
        }
      } else {
        auto [it, inserted] = tree.insert_or_assign(key, -step);
        auto upper = ref.upper_bound(key);
        if (upper == ref.begin() || std::prev(upper)->first != key) {
          REQUIRE(inserted);
          ref.emplace(key, -step);
        } else {
          REQUIRE_FALSE(inserted);
          std::prev(upper)->second = -step;
        }
        REQUIRE(it->second == -step);
      }

      if (step % 50 == 0) {
        verify_against(tree, ref);
      }
      REQUIRE(tree.count(key) == ref.count(key));
    }

    verify_against(tree, ref);
  }
}

TEST_CASE("rb_tree randomized unique keys match std::map",
          "[rb_tree][random]") {
  std::mt19937 rng(99);
  std::uniform_int_distribution<int> key_dist(0, 1000);

  rb_tree<int, int> tree;
  std::map<int, int> ref;

  for (int step = 0; step < 5000; ++step) {
    const int key = key_dist(rng);
    if (rng() % 2 == 0) {
      tree.insert_or_assign(key, step);
      ref[key] = step;
    } else {
      REQUIRE(tree.erase(key) == ref.erase(key));
    }
  }

  REQUIRE(tree.is_valid());
  REQUIRE(tree.size() == ref.size());
  auto it = tree.begin();
  for (const auto& [key, value] : ref) {
    REQUIRE(it->first == key);
    REQUIRE(it->second == value);
    ++it;
  }
  REQUIRE(it == tree.end());
}
