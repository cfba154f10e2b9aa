// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "memprof/alloc/dispatcher.h"
#include "memprof/alloc/profiler.h"
#include "memprof/alloc/scope_guard.h"
#include "memprof/alloc/stack_inspector.h"
#include "memprof/alloc/stats.h"
#include "memprof/alloc/thread_state.h"

using namespace memprof::alloc;

namespace {

Config base_config() {
  Config cfg;
  cfg.enabled = true;
  cfg.classifier_fallback = false;
  cfg.log_sealed_writes = false;
  return cfg;
}

class AllocDispatcherSession : public ::testing::Test {
 protected:
  void SetUp() override { reset_stats(); }
  void TearDown() override { disable(); }
  void start(const Config& cfg = base_config(), StackInspector* inspector = nullptr) {
    ASSERT_TRUE(enable(cfg, inspector));
  }
};

// Returns a fixed one-frame stack and counts captures.
class CountingInspector final : public StackInspector {
 public:
  explicit CountingInspector(const char* frame) : frame_(frame) {}
  int capture(void** pcs, int max_frames, int) noexcept override {
    captures.fetch_add(1, std::memory_order_relaxed);
    if (max_frames < 1) return 0;
    pcs[0] = reinterpret_cast<void*>(std::uintptr_t{0x1000});
    return 1;
  }
  bool symbolize(const void*, char* out, int out_len) noexcept override {
    std::strncpy(out, frame_, static_cast<std::size_t>(out_len) - 1);
    out[out_len - 1] = '\0';
    return true;
  }
  std::atomic<int> captures{0};

 private:
  const char* frame_;
};

int g_site_a = 0;
int g_site_b = 0;

} // namespace

TEST(AllocDispatcher, DisabledIsPlainPassthrough) {
  ASSERT_FALSE(is_enabled());
  reset_stats();
  auto scope = enter_task(TaskHandle{12345});
  void* p = Dispatcher::allocate(100);
  ASSERT_NE(p, nullptr);
  EXPECT_TRUE(Dispatcher::owns(p));
  EXPECT_EQ(Dispatcher::backend_of(p), AllocatorKind::Passthrough);
  EXPECT_EQ(Dispatcher::task_of(p), kNoTask);
  EXPECT_EQ(Dispatcher::requested_size(p), 100u);
  EXPECT_EQ(Dispatcher::resolve_kind(100), AllocatorKind::Passthrough);
  Dispatcher::deallocate(p);
  auto s = stats();
  EXPECT_EQ(s.passthrough_allocations, 1u);
  EXPECT_EQ(s.passthrough_frees, 1u);
  EXPECT_EQ(s.tracked_allocations, 0u);
}

TEST_F(AllocDispatcherSession, NoActiveTaskIsPassthroughWithoutClassifying) {
  CountingInspector insp("app::work()");
  Config cfg = base_config();
  cfg.classifier_fallback = true;
  start(cfg, &insp);
  void* p = Dispatcher::allocate(64, Dispatcher::kDefaultAlignment, &g_site_a);
  EXPECT_EQ(Dispatcher::backend_of(p), AllocatorKind::Passthrough);
  Dispatcher::deallocate(p);
  EXPECT_EQ(insp.captures.load(), 0);
}

TEST_F(AllocDispatcherSession, TrackedAllocationIsAttributedToInnermostTask) {
  start();
  TaskHandle outer = begin_task();
  TaskHandle inner = begin_task();
  void* a = nullptr;
  void* b = nullptr;
  {
    auto so = enter_task(outer);
    a = Dispatcher::allocate(40);
    {
      auto si = enter_task(inner);
      b = Dispatcher::allocate(24);
    }
  }
  EXPECT_EQ(Dispatcher::backend_of(a), AllocatorKind::TaskTracked);
  EXPECT_EQ(Dispatcher::task_of(a), outer.id);
  EXPECT_EQ(Dispatcher::task_of(b), inner.id);
  EXPECT_EQ(task_stats(outer.id)->bytes_allocated, 40u);
  EXPECT_EQ(task_stats(inner.id)->bytes_allocated, 24u);

  // Frees are attributed by block, not by the freeing thread's context.
  Dispatcher::deallocate(b);
  Dispatcher::deallocate(a);
  TaskStats so = end_task(outer);
  TaskStats si = end_task(inner);
  EXPECT_EQ(so.bytes_freed, 40u);
  EXPECT_EQ(si.bytes_freed, 24u);
  EXPECT_EQ(so.live_allocations, 0u);
  EXPECT_EQ(stats().tracked_allocations, 2u);
  EXPECT_EQ(stats().tracked_frees, 2u);
}

TEST_F(AllocDispatcherSession, PassthroughScopeIsolatesAllocations) {
  start();
  TaskHandle t = begin_task();
  auto task = enter_task(t);
  std::vector<void*> blocks;
  {
    auto pass = enter_scope(AllocatorKind::Passthrough);
    for (int i = 0; i < 10; ++i) blocks.push_back(Dispatcher::allocate(128));
    {
      auto nested = enter_scope(AllocatorKind::Passthrough);
      blocks.push_back(Dispatcher::reallocate(nullptr, 32));
    }
  }
  for (void* p : blocks) {
    EXPECT_EQ(Dispatcher::backend_of(p), AllocatorKind::Passthrough);
  }
  // Free outside the scope; the block header still routes to passthrough.
  for (void* p : blocks) Dispatcher::deallocate(p);
  TaskStats s = end_task(t);
  EXPECT_EQ(s, TaskStats{});
}

TEST_F(AllocDispatcherSession, FreeInsidePassthroughScopeStillRecordsTrackedBlock) {
  start();
  TaskHandle t = begin_task();
  void* p = nullptr;
  {
    auto task = enter_task(t);
    p = Dispatcher::allocate(256);
  }
  {
    auto pass = enter_scope(AllocatorKind::Passthrough);
    Dispatcher::deallocate(p);
  }
  TaskStats s = end_task(t);
  EXPECT_EQ(s.bytes_allocated, 256u);
  EXPECT_EQ(s.bytes_freed, 256u);
}

TEST_F(AllocDispatcherSession, SizeThresholdIsExclusive) {
  Config cfg = base_config();
  cfg.size_threshold = 100;
  start(cfg);
  TaskHandle t = begin_task();
  auto task = enter_task(t);
  void* small = Dispatcher::allocate(100);
  void* big = Dispatcher::allocate(101);
  EXPECT_EQ(Dispatcher::backend_of(small), AllocatorKind::Passthrough);
  EXPECT_EQ(Dispatcher::backend_of(big), AllocatorKind::TaskTracked);
  EXPECT_EQ(Dispatcher::resolve_kind(5), AllocatorKind::Passthrough);
  EXPECT_EQ(Dispatcher::resolve_kind(5000), AllocatorKind::TaskTracked);
  Dispatcher::deallocate(small);
  Dispatcher::deallocate(big);
  EXPECT_EQ(task_stats(t.id)->bytes_allocated, 101u);
}

TEST_F(AllocDispatcherSession, WriteToEndedTaskDemotesBlock) {
  start();
  TaskHandle t = begin_task();
  auto task = enter_task(t);
  end_task(t);

  void* p = Dispatcher::allocate(64);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(Dispatcher::backend_of(p), AllocatorKind::Passthrough);
  EXPECT_EQ(Dispatcher::task_of(p), kNoTask);
  Dispatcher::deallocate(p);
  EXPECT_EQ(stats().demoted_allocations, 1u);
  EXPECT_EQ(registry_diagnostics().sealed_writes, 1u);
  EXPECT_EQ(task_stats(t.id)->bytes_allocated, 0u);
}

TEST_F(AllocDispatcherSession, ReentrantCallFallsBackToPassthrough) {
  start();
  TaskHandle t = begin_task();
  auto task = enter_task(t);
  ThreadAllocatorState* st = ThreadStateArena::instance().current();
  ASSERT_NE(st, nullptr);
  st->in_dispatch = true;
  void* p = Dispatcher::allocate(64);
  st->in_dispatch = false;
  EXPECT_EQ(Dispatcher::backend_of(p), AllocatorKind::Passthrough);
  EXPECT_EQ(stats().reentrant_fallbacks, 1u);
  Dispatcher::deallocate(p);
  EXPECT_EQ(task_stats(t.id)->bytes_allocated, 0u);
}

TEST_F(AllocDispatcherSession, AlignmentIsHonored) {
  start();
  TaskHandle t = begin_task();
  auto task = enter_task(t);
  for (std::size_t a : {std::size_t{1}, std::size_t{16}, std::size_t{64}, std::size_t{256}, std::size_t{4096}}) {
    void* p = Dispatcher::allocate(10, a);
    ASSERT_NE(p, nullptr);
    const std::size_t want = a < Dispatcher::kDefaultAlignment ? Dispatcher::kDefaultAlignment : a;
    EXPECT_EQ(reinterpret_cast<std::uintptr_t>(p) % want, 0u) << "alignment " << a;
    std::memset(p, 0xab, 10);
    Dispatcher::deallocate(p);
  }
  EXPECT_EQ(Dispatcher::allocate(10, 48), nullptr);
  TaskStats s = end_task(t);
  EXPECT_EQ(s.bytes_allocated, 50u);
  EXPECT_EQ(s.bytes_freed, 50u);
}

TEST_F(AllocDispatcherSession, ReallocateCopiesAndAccounts) {
  start();
  TaskHandle t = begin_task();
  auto task = enter_task(t);
  char* p = static_cast<char*>(Dispatcher::allocate(8));
  std::memcpy(p, "memprof", 8);
  char* q = static_cast<char*>(Dispatcher::reallocate(p, 32));
  ASSERT_NE(q, nullptr);
  EXPECT_STREQ(q, "memprof");
  EXPECT_EQ(Dispatcher::requested_size(q), 32u);
  char* r = static_cast<char*>(Dispatcher::reallocate(q, 4));
  EXPECT_EQ(std::memcmp(r, "memp", 4), 0);
  EXPECT_EQ(Dispatcher::reallocate(r, 0), nullptr);
  TaskStats s = end_task(t);
  EXPECT_EQ(s.bytes_allocated, 44u);
  EXPECT_EQ(s.bytes_freed, 44u);
  EXPECT_EQ(s.allocation_events, 3u);
  EXPECT_EQ(s.peak_bytes, 40u);
}

TEST_F(AllocDispatcherSession, SiteDecisionsAreCachedPerTaskContext) {
  CountingInspector insp("app::Model::forward()");
  Config cfg = base_config();
  cfg.classifier_fallback = true;
  start(cfg, &insp);
  TaskHandle t = begin_task();
  {
    auto task = enter_task(t);
    for (int i = 0; i < 5; ++i) Dispatcher::deallocate(Dispatcher::allocate(16, Dispatcher::kDefaultAlignment, &g_site_a));
    EXPECT_EQ(insp.captures.load(), 1);
    Dispatcher::deallocate(Dispatcher::allocate(16, Dispatcher::kDefaultAlignment, &g_site_b));
    EXPECT_EQ(insp.captures.load(), 2);
    // No site key: classified every time.
    Dispatcher::deallocate(Dispatcher::allocate(16));
    Dispatcher::deallocate(Dispatcher::allocate(16));
    EXPECT_EQ(insp.captures.load(), 4);
  }
  {
    auto task = enter_task(t);
    Dispatcher::deallocate(Dispatcher::allocate(16, Dispatcher::kDefaultAlignment, &g_site_a));
    EXPECT_EQ(insp.captures.load(), 5);
  }
  EXPECT_EQ(stats().classifier_cache_hits, 4u);
  EXPECT_EQ(end_task(t).allocation_events, 9u);
}

TEST_F(AllocDispatcherSession, HeuristicInternalFrameIsPassthrough) {
  CountingInspector insp("memprof::exporter::Writer::flush()");
  Config cfg = base_config();
  cfg.classifier_fallback = true;
  start(cfg, &insp);
  TaskHandle t = begin_task();
  auto task = enter_task(t);
  void* p = Dispatcher::allocate(16);
  EXPECT_EQ(Dispatcher::backend_of(p), AllocatorKind::Passthrough);
  Dispatcher::deallocate(p);
  // An explicit scope is authoritative over the heuristic.
  {
    auto tracked = enter_scope(AllocatorKind::TaskTracked);
    void* q = Dispatcher::allocate(16);
    EXPECT_EQ(Dispatcher::backend_of(q), AllocatorKind::TaskTracked);
    Dispatcher::deallocate(q);
  }
  EXPECT_EQ(task_stats(t.id)->bytes_allocated, 16u);
}

TEST_F(AllocDispatcherSession, BlockOutlivingSessionIsFreedSafely) {
  start();
  TaskHandle t = begin_task();
  void* p = nullptr;
  {
    auto task = enter_task(t);
    p = Dispatcher::allocate(64);
  }
  EXPECT_EQ(Dispatcher::backend_of(p), AllocatorKind::TaskTracked);
  disable();
  reset_stats();
  Dispatcher::deallocate(p);
  EXPECT_EQ(stats().passthrough_frees, 1u);
}

TEST_F(AllocDispatcherSession, FreeAfterPurgeDoesNotChargeRebegunId) {
  start();
  TaskHandle old_t = begin_task(42);
  void* p = nullptr;
  {
    auto task = enter_task(old_t);
    p = Dispatcher::allocate(64);
  }
  ASSERT_EQ(Dispatcher::task_of(p), 42u);
  EXPECT_EQ(Dispatcher::entry_of(p), old_t.entry);
  end_task(old_t);
  ASSERT_TRUE(purge_task(42));

  TaskHandle new_t = begin_task(42);
  EXPECT_NE(new_t.entry, old_t.entry);
  reset_stats();
  Dispatcher::deallocate(p);
  EXPECT_EQ(stats().passthrough_frees, 1u);
  EXPECT_EQ(stats().tracked_frees, 0u);
  EXPECT_GE(registry_diagnostics().unknown_task_writes, 1u);

  TaskStats s = end_task(new_t);
  EXPECT_EQ(s.bytes_allocated, 0u);
  EXPECT_EQ(s.bytes_freed, 0u);
  EXPECT_EQ(s.live_allocations, 0u);
  EXPECT_EQ(s.net_bytes(), 0);
}

TEST_F(AllocDispatcherSession, FreeAfterReenableDoesNotChargeRebegunId) {
  start();
  TaskHandle old_t = begin_task(42);
  void* p = nullptr;
  {
    auto task = enter_task(old_t);
    p = Dispatcher::allocate(64);
  }
  ASSERT_EQ(Dispatcher::backend_of(p), AllocatorKind::TaskTracked);
  disable();
  start();

  TaskHandle new_t = begin_task(42);
  EXPECT_NE(new_t.entry, old_t.entry);
  reset_stats();
  Dispatcher::deallocate(p);
  EXPECT_EQ(stats().passthrough_frees, 1u);
  EXPECT_EQ(registry_diagnostics().unknown_task_writes, 1u);

  TaskStats s = end_task(new_t);
  EXPECT_EQ(s.bytes_freed, 0u);
  EXPECT_EQ(s.live_allocations, 0u);
  EXPECT_EQ(s.net_bytes(), 0);
}
