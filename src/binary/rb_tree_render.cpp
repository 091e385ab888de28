// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <iostream>
#include <lyra/lyra.hpp>
#include <rbmap/rb_tree.hpp>
#include <string>
#include <vector>

namespace {

void print_keys(const std::string& label,
                const std::vector<std::pair<int, int>>& pairs) {
  std::cout << label << ":";
  for (const auto& [key, value] : pairs) {
    std::cout << " " << key;
  }
  std::cout << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  // Command line parameters
  bool show_help = false;
  std::vector<int> keys;
  std::vector<int> erase_keys;

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(erase_keys, "key")["-e"]["--erase"](
          "Key to remove after all inserts (repeatable)") |
      lyra::arg(keys, "keys")("Keys to insert, in order").cardinality(1, 0);

  // Parse command line
  auto result = cli.parse({argc, argv});

  // Check for errors
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    std::cerr << cli << std::endl;
    return 1;
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  rbmap::rb_tree<int, int> tree;
  for (int key : keys) {
    tree.insert(key, key);
  }
  for (int key : erase_keys) {
    if (!tree.remove(key).has_value()) {
      std::cout << "Key " << key << " not present" << std::endl;
    }
  }

  std::cout << tree.debug_render();
  print_keys("In-order", tree.inorder());
  print_keys("Pre-order", tree.preorder());
  print_keys("Post-order", tree.postorder());
  std::cout << "Size: " << tree.size() << ", height: " << tree.height()
            << ", black height: " << tree.black_height() << std::endl;

  if (auto violation = tree.validate()) {
    std::cout << "Invalid: " << rbmap::to_string(*violation) << std::endl;
    return 1;
  }
  std::cout << "Valid red-black tree" << std::endl;
  return 0;
}
