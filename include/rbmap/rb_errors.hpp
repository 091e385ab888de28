// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rbmap {

/**
 * Structural rules checked by rb_tree::validate().
 *
 * The first five map one-to-one onto the red-black properties:
 *   1. Every node is red or black.
 *   2. The root is black.
 *   3. A red node has no red child.
 *   4. Every path from a node to a descendant sentinel has the same number of
 *      black nodes.
 *   5. The sentinel is black.
 *
 * The remaining kinds cover bookkeeping the properties take for granted.
 */
enum class rb_violation {
  invalid_color,          // rule 1
  red_root,               // rule 2
  red_red,                // rule 3
  black_height_mismatch,  // rule 4
  red_sentinel,           // rule 5
  broken_parent_link,     // child->parent does not point back
  out_of_order,           // in-order keys decrease
  size_mismatch,          // node count != size()
};

/**
 * Returns a fixed, human-readable description of a violation.
 */
constexpr std::string_view to_string(rb_violation violation) {
  switch (violation) {
    case rb_violation::invalid_color:
      return "red-black property 1 violated: node is neither red nor black";
    case rb_violation::red_root:
      return "red-black property 2 violated: root is red";
    case rb_violation::red_red:
      return "red-black property 3 violated: red node has a red child";
    case rb_violation::black_height_mismatch:
      return "red-black property 4 violated: black heights differ";
    case rb_violation::red_sentinel:
      return "red-black property 5 violated: sentinel is red";
    case rb_violation::broken_parent_link:
      return "parent link does not match child link";
    case rb_violation::out_of_order:
      return "keys are not in non-decreasing order";
    case rb_violation::size_mismatch:
      return "node count does not match size()";
  }
  return "unknown violation";
}

/**
 * Thrown when an operation finds the tree's internal links in a state the
 * algorithms never produce (e.g. a parent that does not link back to its
 * child). The tree must be considered corrupted; the library never catches
 * this.
 */
class broken_invariant : public std::logic_error {
 public:
  explicit broken_invariant(const std::string& what)
      : std::logic_error("rb_tree: broken invariant: " + what) {}
};

}  // namespace rbmap
