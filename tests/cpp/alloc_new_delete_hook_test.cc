// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Linked with the global operator new/delete replacement.

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <new>
#include <string>
#include <thread>

#include "memprof/alloc/dispatcher.h"
#include "memprof/alloc/profiler.h"
#include "memprof/alloc/scope_guard.h"
#include "memprof/alloc/stats.h"

using namespace memprof::alloc;

namespace {

struct alignas(256) Overaligned {
  char bytes[256];
};

class AllocNewDeleteHook : public ::testing::Test {
 protected:
  void SetUp() override {
    Config cfg;
    cfg.enabled = true;
    cfg.classifier_fallback = false;
    cfg.lock_timeout = std::chrono::microseconds(1000000);
    ASSERT_TRUE(enable(cfg));
  }
  void TearDown() override { disable(); }
};

} // namespace

TEST(AllocNewDeleteHookDisabled, EveryNewCarriesAHeader) {
  ASSERT_FALSE(is_enabled());
  auto* p = new int(7);
  EXPECT_TRUE(Dispatcher::owns(p));
  EXPECT_EQ(Dispatcher::backend_of(p), AllocatorKind::Passthrough);
  EXPECT_EQ(Dispatcher::requested_size(p), sizeof(int));
  delete p;

  std::string s(200, 'x');
  EXPECT_TRUE(Dispatcher::owns(s.data()));
}

TEST_F(AllocNewDeleteHook, NewInsideTaskIsTracked) {
  TaskHandle t = begin_task();
  std::uint64_t* arr = nullptr;
  {
    auto task = enter_task(t);
    arr = new std::uint64_t[8];
  }
  EXPECT_EQ(Dispatcher::backend_of(arr), AllocatorKind::TaskTracked);
  EXPECT_EQ(Dispatcher::task_of(arr), t.id);
  delete[] arr;
  TaskStats s = end_task(t);
  EXPECT_EQ(s.bytes_allocated, 64u);
  EXPECT_EQ(s.bytes_freed, 64u);
  EXPECT_EQ(s.live_allocations, 0u);
}

TEST_F(AllocNewDeleteHook, PassthroughScopeHidesAllocations) {
  TaskHandle t = begin_task();
  {
    auto task = enter_task(t);
    auto pass = enter_scope(AllocatorKind::Passthrough);
    auto owned = std::make_unique<std::string>(1000, 'y');
    EXPECT_EQ(Dispatcher::backend_of(owned.get()), AllocatorKind::Passthrough);
  }
  EXPECT_EQ(end_task(t), TaskStats{});
}

TEST_F(AllocNewDeleteHook, RegistryBookkeepingIsNotChargedToTheTask) {
  TaskHandle outer = begin_task();
  {
    auto task = enter_task(outer);
    for (int i = 0; i < 32; ++i) {
      TaskHandle h = begin_task();
      end_task(h);
    }
    purge_sealed_tasks();
  }
  TaskStats s = end_task(outer);
  EXPECT_EQ(s.bytes_allocated, 0u);
  EXPECT_EQ(s.allocation_events, 0u);
}

TEST_F(AllocNewDeleteHook, OveralignedAndNothrowForms) {
  TaskHandle t = begin_task();
  {
    auto task = enter_task(t);
    auto* big = new Overaligned;
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(big) % alignof(Overaligned), 0u);
    EXPECT_EQ(Dispatcher::backend_of(big), AllocatorKind::TaskTracked);
    delete big;

    auto* n = new (std::nothrow) char[100];
    ASSERT_NE(n, nullptr);
    EXPECT_EQ(Dispatcher::backend_of(n), AllocatorKind::TaskTracked);
    delete[] n;
  }
  TaskStats s = end_task(t);
  EXPECT_EQ(s.bytes_allocated, sizeof(Overaligned) + 100u);
  EXPECT_EQ(s.bytes_freed, sizeof(Overaligned) + 100u);
}

TEST_F(AllocNewDeleteHook, FreeOnAnotherThreadIsAttributedToOwner) {
  TaskHandle t = begin_task();
  int* p = nullptr;
  std::thread th([&] {
    auto task = enter_task(t);
    p = new int[16];
  });
  th.join();
  EXPECT_EQ(task_stats(t.id)->live_allocations, 1u);
  delete[] p;
  TaskStats s = end_task(t);
  EXPECT_EQ(s.bytes_allocated, 16u * sizeof(int));
  EXPECT_EQ(s.bytes_freed, 16u * sizeof(int));
}

TEST_F(AllocNewDeleteHook, OutOfMemoryThrowsBadAlloc) {
  TaskHandle t = begin_task();
  {
    auto task = enter_task(t);
    // Larger than any address space.
    const std::size_t huge = static_cast<std::size_t>(-1) / 2;
    EXPECT_THROW((void)::operator new(huge), std::bad_alloc);
    EXPECT_EQ(::operator new(huge, std::nothrow), nullptr);
  }
  EXPECT_EQ(end_task(t).bytes_allocated, 0u);
}
