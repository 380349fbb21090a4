// Copyright (c) 2025 <Your Name>
/**
 * @file client_registry_concurrency_test.cc
 * @brief ClientRegistry invariants under concurrent add/remove/find/list.
 */
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "ysfreflector/client_registry.hpp"

namespace ysfreflector {

namespace {

std::string AddressOf(int i) { return "127.0.0." + std::to_string(i); }
int PortOf(int i) { return 10000 + i; }

ClientRecordPtr MakeRecord(int i) {
  return std::make_shared<ClientRecord>(
      ClientKey(AddressOf(i), static_cast<uint16_t>(PortOf(i))),
      "CALL" + std::to_string(i));
}

void ExpectIntact(const ClientRegistry& registry) {
  std::string error;
  EXPECT_TRUE(registry.CheckIntegrity(&error)) << error;
  EXPECT_TRUE(registry.Healthy());
}

}  // namespace

/**
 * @test ClientRegistryConcurrencyTest.RemoversAndFindersOnPopulatedRegistry
 * @brief Disjoint removers and finders racing on 100 records.
 *
 * @steps
 * 1. Add 100 records 127.0.0.i:10000+i.
 * 2. Start 5 remover threads on disjoint ranges of 10 (0..49) and 5 finder
 *    threads on disjoint ranges of 20 (0..99).
 * 3. Join all threads.
 *
 * @expected
 * - Every remaining index entry maps to a record with the same identity.
 * - Every removed identity is absent; every other identity is present.
 * - Every record a finder saw carried the label of its identity.
 */
TEST(ClientRegistryConcurrencyTest, RemoversAndFindersOnPopulatedRegistry) {
  ClientRegistry registry;
  for (int i = 0; i < 100; ++i) {
    ASSERT_EQ(registry.Add(MakeRecord(i)), ClientRegistry::AddResult::kAdded);
  }

  std::atomic<int> mismatches{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 5; ++t) {
    threads.emplace_back([&registry, t]() {
      for (int i = t * 10; i < t * 10 + 10; ++i) {
        auto c = registry.Find(AddressOf(i), PortOf(i));
        if (c) registry.Remove(*c);
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
    });
  }
  for (int t = 0; t < 5; ++t) {
    threads.emplace_back([&registry, &mismatches, t]() {
      for (int i = t * 20; i < t * 20 + 20; ++i) {
        auto c = registry.Find(AddressOf(i), PortOf(i));
        if (c && (c->Label() != "CALL" + std::to_string(i) ||
                  c->Port() != PortOf(i))) {
          mismatches.fetch_add(1);
        }
        std::this_thread::sleep_for(std::chrono::microseconds(50));
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(mismatches.load(), 0);
  ExpectIntact(registry);
  EXPECT_EQ(registry.Size(), 50u);
  for (int i = 0; i < 100; ++i) {
    auto c = registry.Find(AddressOf(i), PortOf(i));
    if (i < 50) {
      EXPECT_EQ(c, nullptr) << "removed identity still present: " << i;
    } else {
      ASSERT_NE(c, nullptr) << i;
      EXPECT_EQ(c->Label(), "CALL" + std::to_string(i));
    }
  }
}

/**
 * @test ClientRegistryConcurrencyTest.ConcurrentAddRemoveFind
 * @brief Adders, finders and removers all start on an empty registry.
 *
 * @steps
 * 1. 5 adders insert disjoint ranges of 20 identities.
 * 2. 5 finders look up the same ranges and record what they saw.
 * 3. 5 removers remove whatever they find in 0..49.
 *
 * @expected
 * - Any identity a finder saw that is still present carries the same label.
 * - All index entries are in range and point at their own identity.
 * - Identities 50..99 are all present.
 */
TEST(ClientRegistryConcurrencyTest, ConcurrentAddRemoveFind) {
  ClientRegistry registry;
  std::mutex results_mtx;
  std::vector<std::tuple<std::string, int, std::string>> results;

  std::vector<std::thread> threads;
  for (int t = 0; t < 5; ++t) {
    threads.emplace_back([&registry, t]() {
      for (int i = t * 20; i < t * 20 + 20; ++i) {
        registry.Add(MakeRecord(i));
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    });
  }
  for (int t = 0; t < 5; ++t) {
    threads.emplace_back([&registry, &results, &results_mtx, t]() {
      for (int i = t * 20; i < t * 20 + 20; ++i) {
        auto c = registry.Find(AddressOf(i), PortOf(i));
        if (c) {
          std::lock_guard<std::mutex> lk(results_mtx);
          results.emplace_back(AddressOf(i), PortOf(i), c->Label());
        }
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
    });
  }
  for (int t = 0; t < 5; ++t) {
    threads.emplace_back([&registry, t]() {
      for (int i = t * 10; i < t * 10 + 10; ++i) {
        auto c = registry.Find(AddressOf(i), PortOf(i));
        if (c) registry.Remove(*c);
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    });
  }
  for (auto& th : threads) th.join();

  for (const auto& r : results) {
    auto c = registry.Find(std::get<0>(r), std::get<1>(r));
    if (c) EXPECT_EQ(c->Label(), std::get<2>(r));
  }
  ExpectIntact(registry);
  for (int i = 50; i < 100; ++i) {
    EXPECT_NE(registry.Find(AddressOf(i), PortOf(i)), nullptr) << i;
  }
}

/**
 * @test ClientRegistryConcurrencyTest.RandomizedStress
 * @brief Random mix of every operation from many threads over a small key
 *        space, so that swap-remove relocations race with lookups.
 *
 * @expected
 * - No lookup ever returns a record whose identity differs from the query.
 * - No snapshot ever contains two records with the same identity.
 * - Integrity holds after all threads join.
 */
TEST(ClientRegistryConcurrencyTest, RandomizedStress) {
  ClientRegistry registry;
  constexpr int kKeys = 32;
  constexpr int kThreads = 8;
  constexpr int kOpsPerThread = 20000;
  std::atomic<int> torn{0};
  std::atomic<int> duplicates{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      std::mt19937 rng(static_cast<unsigned>(t) * 7919U + 1U);
      std::uniform_int_distribution<int> key_dist(0, kKeys - 1);
      std::uniform_int_distribution<int> op_dist(0, 99);
      for (int n = 0; n < kOpsPerThread; ++n) {
        const int i = key_dist(rng);
        const int op = op_dist(rng);
        if (op < 30) {
          registry.Add(MakeRecord(i));
        } else if (op < 40) {
          registry.FindOrAdd(MakeRecord(i));
        } else if (op < 65) {
          registry.Remove(ClientKey(AddressOf(i),
                                    static_cast<uint16_t>(PortOf(i))));
        } else if (op < 97) {
          auto c = registry.Find(AddressOf(i), PortOf(i));
          if (c && (c->Address() != AddressOf(i) || c->Port() != PortOf(i))) {
            torn.fetch_add(1);
          }
        } else {
          auto snapshot = registry.List();
          std::vector<bool> seen(kKeys, false);
          for (const auto& c : snapshot) {
            const int idx = c->Port() - 10000;
            if (idx < 0 || idx >= kKeys) continue;
            if (seen[idx]) duplicates.fetch_add(1);
            seen[idx] = true;
          }
        }
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(duplicates.load(), 0);
  ExpectIntact(registry);
  EXPECT_LE(registry.Size(), static_cast<size_t>(kKeys));
}

/**
 * @test ClientRegistryConcurrencyTest.SweeperStyleListAndRemove
 * @brief One thread repeatedly lists and removes everything it sees while
 *        others keep adding; snapshots stay usable after mutation.
 */
TEST(ClientRegistryConcurrencyTest, SweeperStyleListAndRemove) {
  ClientRegistry registry;
  std::atomic<bool> stop{false};

  std::vector<std::thread> adders;
  for (int t = 0; t < 3; ++t) {
    adders.emplace_back([&registry, &stop, t]() {
      int n = 0;
      while (!stop.load()) {
        registry.Add(MakeRecord(t * 50 + (n++ % 50)));
      }
    });
  }

  while (registry.Size() == 0) std::this_thread::yield();
  size_t swept = 0;
  for (int round = 0; round < 200; ++round) {
    auto snapshot = registry.List();
    const size_t len = snapshot.size();
    for (const auto& c : snapshot) {
      if (registry.Remove(*c)) ++swept;
    }
    // Snapshot contents survive the removals above.
    EXPECT_EQ(snapshot.size(), len);
    for (const auto& c : snapshot) ASSERT_NE(c, nullptr);
  }
  stop.store(true);
  for (auto& th : adders) th.join();

  EXPECT_GT(swept, 0u);
  ExpectIntact(registry);
}

}  // namespace ysfreflector
