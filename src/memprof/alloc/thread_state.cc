// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "memprof/alloc/thread_state.h"


#include "memprof/alloc/detail/stats_internal.h"

namespace memprof { namespace alloc {

namespace {

constinit ThreadStateArena g_arena{};

// Trivially destructible: readable from any thread_local destructor, including
// those that run after SlotReleaser.
thread_local ThreadAllocatorState* tls_state = nullptr;
thread_local int tls_slot = -1;
thread_local ThreadPhase tls_phase = ThreadPhase::Uninitialized;
thread_local bool tls_initializing = false;

struct SlotReleaser {
  ~SlotReleaser() { ThreadStateArena::instance().teardown_current_thread(); }
  void arm() noexcept {}
};

inline std::size_t site_index(const void* site) noexcept {
  auto v = reinterpret_cast<std::uintptr_t>(site);
  v ^= v >> 17;
  v *= 0x9E3779B97F4A7C15ull;
  return static_cast<std::size_t>(v >> 40) & (kSiteCacheSize - 1);
}

} // namespace

void ThreadAllocatorState::reset() noexcept {
  clear();
  current_kind = AllocatorKind::TaskTracked;
  context_epoch = 1;
  initialized = true;
}

void ThreadAllocatorState::clear() noexcept {
  current_kind = AllocatorKind::Passthrough;
  initialized = false;
  in_dispatch = false;
  override_depth = 0;
  task_depth = 0;
  context_epoch = 0;
  task_stack.fill(kNoTask);
  site_cache.fill(SiteCacheEntry{});
}

bool ThreadAllocatorState::push_task(TaskId id) noexcept {
  if (task_depth >= kMaxTaskDepth) {
    _stats_task_stack_overflow();
    return false;
  }
  task_stack[task_depth++] = id;
  ++context_epoch;
  return true;
}

bool ThreadAllocatorState::pop_task(TaskId id) noexcept {
  if (task_depth == 0) return false;
  if (task_stack[task_depth - 1] == id) {
    task_stack[--task_depth] = kNoTask;
    ++context_epoch;
    return true;
  }
  for (std::uint32_t i = task_depth; i-- > 0;) {
    if (task_stack[i] == id) {
      for (std::uint32_t j = i; j + 1 < task_depth; ++j) task_stack[j] = task_stack[j + 1];
      task_stack[--task_depth] = kNoTask;
      ++context_epoch;
      break;
    }
  }
  return false;
}

const SiteCacheEntry* ThreadAllocatorState::lookup_site(const void* site, std::uint64_t generation) const noexcept {
  const SiteCacheEntry& e = site_cache[site_index(site)];
  if (e.epoch != context_epoch || e.generation != generation || e.site != site) return nullptr;
  return &e;
}

void ThreadAllocatorState::remember_site(const void* site, std::uint64_t generation, AllocatorKind kind) noexcept {
  SiteCacheEntry& e = site_cache[site_index(site)];
  e.site = site;
  e.epoch = context_epoch;
  e.generation = generation;
  e.kind = kind;
}

ThreadStateArena& ThreadStateArena::instance() noexcept { return g_arena; }

int ThreadStateArena::claim_slot_() noexcept {
  if (in_use_.load(std::memory_order_relaxed) >= kMaxThreadSlots) return -1;
  const std::size_t start = hint_.load(std::memory_order_relaxed);
  for (std::size_t n = 0; n < kMaxThreadSlots; ++n) {
    const std::size_t i = (start + n) % kMaxThreadSlots;
    bool expected = false;
    if (!slots_[i].claimed.load(std::memory_order_relaxed) &&
        slots_[i].claimed.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
      hint_.store((i + 1) % kMaxThreadSlots, std::memory_order_relaxed);
      in_use_.fetch_add(1, std::memory_order_relaxed);
      return static_cast<int>(i);
    }
  }
  return -1;
}

void ThreadStateArena::release_slot_(int idx) noexcept {
  if (idx < 0 || static_cast<std::size_t>(idx) >= kMaxThreadSlots) return;
  slots_[static_cast<std::size_t>(idx)].state.clear();
  slots_[static_cast<std::size_t>(idx)].claimed.store(false, std::memory_order_release);
  in_use_.fetch_sub(1, std::memory_order_relaxed);
}

ThreadAllocatorState* ThreadStateArena::current_or_init() noexcept {
  if (tls_phase == ThreadPhase::Active) return tls_state;
  if (tls_phase == ThreadPhase::TornDown || tls_initializing) return nullptr;

  tls_initializing = true;
  const int idx = claim_slot_();
  if (idx < 0) {
    // Stay Uninitialized; the next call retries.
    _stats_arena_exhausted();
    tls_initializing = false;
    return nullptr;
  }
  // First odr-use registers the exit-time teardown. glibc books the destructor
  // with calloc, which does not re-enter operator new.
  thread_local SlotReleaser releaser;
  releaser.arm();

  ThreadAllocatorState& st = slots_[static_cast<std::size_t>(idx)].state;
  st.reset();
  tls_slot = idx;
  tls_state = &st;
  tls_phase = ThreadPhase::Active;
  tls_initializing = false;
  return tls_state;
}

ThreadAllocatorState* ThreadStateArena::current() noexcept {
  return tls_phase == ThreadPhase::Active ? tls_state : nullptr;
}

ThreadPhase ThreadStateArena::phase() const noexcept { return tls_phase; }

void ThreadStateArena::teardown_current_thread() noexcept {
  if (tls_phase == ThreadPhase::TornDown) return;
  const ThreadPhase prev = tls_phase;
  tls_phase = ThreadPhase::TornDown;
  tls_state = nullptr;
  if (prev == ThreadPhase::Active) release_slot_(tls_slot);
  tls_slot = -1;
}

}} // namespace memprof::alloc
