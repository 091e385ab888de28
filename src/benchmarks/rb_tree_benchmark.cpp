// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <absl/container/btree_map.h>
#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstdint>
#include <map>
#include <random>
#include <rbmap/pool_allocator.hpp>
#include <rbmap/rb_tree.hpp>
#include <vector>

using namespace rbmap;

// Pool size large enough that the largest runs rarely grow
constexpr size_t POOL_SIZE_MB = 64;

using StdMap = std::map<int64_t, int64_t>;
using AbslMap = absl::btree_map<int64_t, int64_t>;
using RbTree = rb_tree<int64_t, int64_t>;
using PooledRbTree =
    rb_tree<int64_t, int64_t, std::less<int64_t>,
            PoolAllocator<std::pair<int64_t, int64_t>>>;

template <typename Map>
Map make_map() {
  if constexpr (std::is_same_v<Map, PooledRbTree>) {
    return Map(PoolAllocator<std::pair<int64_t, int64_t>>(
        POOL_SIZE_MB * 1024 * 1024, false));
  } else {
    return Map();
  }
}

std::vector<int64_t> shuffled_keys(size_t count, uint64_t seed) {
  std::vector<int64_t> keys(count);
  for (size_t i = 0; i < count; ++i) {
    keys[i] = static_cast<int64_t>(i) * 7;
  }
  std::mt19937_64 rng(seed);
  std::shuffle(keys.begin(), keys.end(), rng);
  return keys;
}

// Benchmark: Insert shuffled keys into an empty map
template <typename Map>
static void BM_Insert(benchmark::State& state) {
  const size_t count = state.range(0);
  const auto keys = shuffled_keys(count, 12345);

  for (auto _ : state) {
    state.PauseTiming();
    Map map = make_map<Map>();
    state.ResumeTiming();

    for (int64_t key : keys) {
      map.insert_or_assign(key, key * 2);
    }

    benchmark::DoNotOptimize(map);
  }

  state.SetItemsProcessed(state.iterations() * count);
}

// Benchmark: Random lookups, half of which miss
template <typename Map>
static void BM_Find(benchmark::State& state) {
  const size_t count = state.range(0);
  const auto keys = shuffled_keys(count, 12345);

  Map map = make_map<Map>();
  for (int64_t key : keys) {
    map.insert_or_assign(key, key);
  }

  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int64_t> dist(0, count * 7);
  std::vector<int64_t> probes(10000);
  for (auto& probe : probes) {
    probe = dist(rng);
  }

  for (auto _ : state) {
    for (int64_t probe : probes) {
      benchmark::DoNotOptimize(map.find(probe));
    }
  }

  state.SetItemsProcessed(state.iterations() * probes.size());
}

// Benchmark: Erase every key in shuffled order
template <typename Map>
static void BM_Erase(benchmark::State& state) {
  const size_t count = state.range(0);
  const auto keys = shuffled_keys(count, 12345);
  const auto erase_order = shuffled_keys(count, 54321);

  for (auto _ : state) {
    state.PauseTiming();
    Map map = make_map<Map>();
    for (int64_t key : keys) {
      map.insert_or_assign(key, key);
    }
    state.ResumeTiming();

    for (int64_t key : erase_order) {
      benchmark::DoNotOptimize(map.erase(key));
    }
  }

  state.SetItemsProcessed(state.iterations() * count);
}

// Benchmark: Full in-order iteration
template <typename Map>
static void BM_Iterate(benchmark::State& state) {
  const size_t count = state.range(0);
  Map map = make_map<Map>();
  for (int64_t key : shuffled_keys(count, 12345)) {
    map.insert_or_assign(key, key);
  }

  for (auto _ : state) {
    int64_t sum = 0;
    for (const auto& [key, value] : map) {
      sum += value;
    }
    benchmark::DoNotOptimize(sum);
  }

  state.SetItemsProcessed(state.iterations() * count);
}

BENCHMARK_TEMPLATE(BM_Insert, StdMap)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Insert, AbslMap)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Insert, RbTree)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Insert, PooledRbTree)->Range(1 << 10, 1 << 20);

BENCHMARK_TEMPLATE(BM_Find, StdMap)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Find, AbslMap)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Find, RbTree)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Find, PooledRbTree)->Range(1 << 10, 1 << 20);

BENCHMARK_TEMPLATE(BM_Erase, StdMap)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Erase, AbslMap)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Erase, RbTree)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Erase, PooledRbTree)->Range(1 << 10, 1 << 20);

BENCHMARK_TEMPLATE(BM_Iterate, StdMap)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Iterate, AbslMap)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Iterate, RbTree)->Range(1 << 10, 1 << 20);
BENCHMARK_TEMPLATE(BM_Iterate, PooledRbTree)->Range(1 << 10, 1 << 20);

BENCHMARK_MAIN();
