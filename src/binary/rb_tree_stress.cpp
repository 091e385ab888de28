// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <lyra/lyra.hpp>
#include <map>
#include <random>
#include <rbmap/pool_allocator.hpp>
#include <rbmap/rb_tree.hpp>
#include <unordered_set>

namespace {

struct StressConfig {
  uint64_t seed;
  size_t target_iterations;
  size_t min_keys;
  size_t max_keys;
  size_t batches;
  size_t batch_size;
};

// Runs randomized insert/erase batches against std::map and exits with
// status 1 on the first disagreement or red-black violation.
template <typename Tree>
void run_stress(const StressConfig& config, const Tree& prototype) {
  std::uniform_int_distribution<size_t> num_key_dist(config.min_keys,
                                                     config.max_keys);
  for (size_t iter = 0; iter < config.target_iterations; ++iter) {
    std::mt19937 rng(iter + config.seed);
    std::uniform_int_distribution<int> dist(std::numeric_limits<int>::min(),
                                            std::numeric_limits<int>::max());

    size_t num_keys = num_key_dist(rng);
    std::cout << "Iteration " << iter << " using " << num_keys << " keys, seed "
              << iter + config.seed << std::endl;

    std::map<int, int> ordered_map;
    Tree tree(prototype.get_allocator());
    std::unordered_set<int> seen;

    auto insert = [&]() -> void {
      int key = dist(rng);
      int val = dist(rng);
      ordered_map.insert_or_assign(key, val);
      tree.insert_or_assign(key, val);
      seen.insert(key);
    };

    auto remove = [&]() -> void {
      auto key = *seen.begin();
      seen.erase(key);
      ordered_map.erase(key);
      if (!tree.remove(key).has_value()) {
        std::cout << "Key " << key << " missing from rb_tree" << std::endl;
        exit(1);
      }
    };

    auto validate = [&]() -> void {
      if (auto violation = tree.validate()) {
        std::cout << "Invalid tree: " << rbmap::to_string(*violation)
                  << std::endl;
        exit(1);
      }

      auto it = ordered_map.begin();
      auto tree_it = tree.begin();

      while (it != ordered_map.end() && tree_it != tree.end()) {
        if (it->first != tree_it->first || it->second != tree_it->second) {
          std::cout << "Mismatch at key " << it->first
                    << " != " << tree_it->first << std::endl;
          exit(1);
        }
        ++it;
        ++tree_it;
      }

      if (it != ordered_map.end()) {
        std::cout << "rb_tree ended early!" << std::endl;
        exit(1);
      }

      if (tree_it != tree.end()) {
        std::cout << "Ordered map ended early!" << std::endl;
        exit(1);
      }
    };

    // Build up the initial tree/map
    while (ordered_map.size() < num_keys) {
      insert();
    }
    validate();

    // Run erase/insert batches
    for (size_t batch = 0; batch < config.batches; ++batch) {
      for (size_t i = 0; i < config.batch_size && !seen.empty(); ++i) {
        remove();
      }
      for (size_t i = 0; i < config.batch_size; ++i) {
        insert();
      }
      validate();
    }

    // Empty out the tree/map
    while (!seen.empty()) {
      remove();
    }
    validate();
    if (!tree.empty()) {
      std::cout << "rb_tree not empty after removing every key" << std::endl;
      exit(1);
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  bool show_help = false;
  bool use_pool = false;
  StressConfig config{
      static_cast<uint64_t>(
          std::chrono::system_clock::now().time_since_epoch().count()),
      10, 10000, 200000, 100, 1000};

  // Define command line interface
  auto cli =
      lyra::cli() | lyra::help(show_help) |
      lyra::opt(config.seed, "seed")["-d"]["--seed"](
          "Random seed (defaults to time since epoch)") |
      lyra::opt(config.target_iterations,
                "iterations")["-i"]["--iterations"]("Iterations to run") |
      lyra::opt(config.min_keys,
                "min_keys")["--min-keys"]("Minimum keys to target in tree") |
      lyra::opt(config.max_keys,
                "max_keys")["--max-keys"]("Maximum keys to target in tree") |
      lyra::opt(config.batches, "batches")["-b"]["--batches"](
          "Number of erase/insert batches to run") |
      lyra::opt(config.batch_size, "batch_size")["-s"]["--batch-size"](
          "Size of an erase/insert batch") |
      lyra::opt(use_pool)["-p"]["--pool"]("Allocate nodes from a NodePool");

  // Parse command line
  auto result = cli.parse({argc, argv});
  if (!result) {
    std::cerr << "Error in command line: " << result.message() << std::endl;
    exit(1);
  }

  // Show help if requested
  if (show_help) {
    std::cout << cli << std::endl;
    return 0;
  }

  if (config.min_keys > config.max_keys) {
    std::cerr << "--min-keys must not exceed --max-keys" << std::endl;
    exit(1);
  }

  if (use_pool) {
    using Alloc = rbmap::PoolAllocator<std::pair<int, int>>;
    rbmap::rb_tree<int, int, std::less<int>, Alloc> prototype;
    run_stress(config, prototype);
  } else {
    rbmap::rb_tree<int, int> prototype;
    run_stress(config, prototype);
  }
  return 0;
}
