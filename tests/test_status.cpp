/**
 * @file test_status.cpp
 * @brief Tests for status.hpp
 */

#include "forge/status.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace {

/// Spin until @p n threads are blocked in the register, or give up.
bool WaitForWaiters(const forge::StatusRegister& reg, uint32_t n) {
  for (int i = 0; i < 2000; ++i) {
    if (reg.WaiterCount() >= n) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return false;
}

forge::Outcome MakeHealthy() {
  return forge::Outcome::Healthy(forge::TransitionKind::kReset,
                                 forge::SystemSnapshot{});
}

}  // namespace

TEST_CASE("StatusRegister initial outcome", "[status]") {
  forge::StatusRegister reg;
  auto o = reg.Get();
  REQUIRE(o.sequence == 0U);
  REQUIRE(o.ok());
  REQUIRE(o.kind == forge::TransitionKind::kInitial);
  REQUIRE(o.system.Empty());
  REQUIRE(reg.WaiterCount() == 0U);
}

TEST_CASE("StatusRegister Set assigns increasing sequence numbers", "[status]") {
  forge::StatusRegister reg;
  REQUIRE(reg.Set(MakeHealthy()) == 1U);

  forge::TransitionFailure failure;
  failure.error = forge::ResetError::kStartFailed;
  failure.failing_key = "db";
  REQUIRE(reg.Set(forge::Outcome::Unhealthy(forge::TransitionKind::kReset,
                                            failure, forge::SystemSnapshot{})) == 2U);

  auto o = reg.Get();
  REQUIRE(o.sequence == 2U);
  REQUIRE(!o.ok());
  REQUIRE(o.failure.error == forge::ResetError::kStartFailed);
  REQUIRE(o.failure.failing_key == "db");
  REQUIRE(reg.Sequence() == 2U);
}

TEST_CASE("StatusRegister AwaitChangeFor times out without a Set", "[status]") {
  forge::StatusRegister reg;
  auto r = reg.AwaitChangeFor(20U);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == forge::StatusError::kTimeout);
  REQUIRE(reg.WaiterCount() == 0U);
}

TEST_CASE("StatusRegister AwaitChangeAfter returns a missed change at once", "[status]") {
  forge::StatusRegister reg;
  const uint64_t seen = reg.Sequence();
  reg.Set(MakeHealthy());

  auto r = reg.AwaitChangeAfter(seen, 0U);
  REQUIRE(r.has_value());
  REQUIRE(r.value().sequence == seen + 1U);

  auto again = reg.AwaitChangeAfter(r.value().sequence, 10U);
  REQUIRE(!again.has_value());
}

TEST_CASE("StatusRegister one Set releases every waiter once", "[status]") {
  forge::StatusRegister reg;
  constexpr uint32_t kWaiters = 8;
  std::atomic<uint32_t> released{0};
  std::atomic<uint64_t> seq_sum{0};

  std::vector<std::thread> threads;
  for (uint32_t i = 0; i < kWaiters; ++i) {
    threads.emplace_back([&] {
      auto o = reg.AwaitChange();
      seq_sum.fetch_add(o.sequence);
      released.fetch_add(1);
    });
  }

  REQUIRE(WaitForWaiters(reg, kWaiters));
  REQUIRE(released.load() == 0U);

  reg.Set(MakeHealthy());
  for (auto& t : threads) t.join();

  REQUIRE(released.load() == kWaiters);
  REQUIRE(seq_sum.load() == kWaiters);
  REQUIRE(reg.WaiterCount() == 0U);
}

TEST_CASE("StatusRegister waiter registered after a Set sees only the next one", "[status]") {
  forge::StatusRegister reg;
  reg.Set(MakeHealthy());

  std::atomic<uint64_t> got{0};
  std::thread waiter([&] { got.store(reg.AwaitChange().sequence); });

  REQUIRE(WaitForWaiters(reg, 1U));
  REQUIRE(got.load() == 0U);
  reg.Set(MakeHealthy());
  waiter.join();
  REQUIRE(got.load() == 2U);
}

TEST_CASE("StatusRegister abandoned timed waits leave no registration", "[status]") {
  forge::StatusRegister reg;
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] { (void)reg.AwaitChangeFor(15U); });
  }
  for (auto& t : threads) t.join();
  REQUIRE(reg.WaiterCount() == 0U);

  reg.Set(MakeHealthy());
  REQUIRE(reg.Sequence() == 1U);
}
