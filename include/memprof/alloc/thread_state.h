// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

#include "memprof/alloc/kind.h"

namespace memprof { namespace alloc {

// Per-thread lifecycle. Uninitialized -> Active on first use (retried on
// failure); Active -> TornDown exactly once, when the thread's storage dies.
enum class ThreadPhase : std::uint8_t {
  Uninitialized = 0,
  Active = 1,
  TornDown = 2,
};

inline constexpr std::size_t kSiteCacheSize = 32;  // power of two
inline constexpr std::size_t kMaxTaskDepth = 16;
inline constexpr std::size_t kMaxThreadSlots = 512;

struct SiteCacheEntry {
  const void*   site{nullptr};
  std::uint64_t epoch{0};       // ThreadAllocatorState::context_epoch at insert
  std::uint64_t generation{0};  // classifier generation at insert
  AllocatorKind kind{AllocatorKind::Passthrough};
};

// Owned and mutated exclusively by its thread; no locking.
// All-zero is the unclaimed representation; reset() establishes defaults.
struct ThreadAllocatorState {
  AllocatorKind current_kind{AllocatorKind::Passthrough};
  bool          initialized{false};
  bool          in_dispatch{false};
  std::uint32_t override_depth{0};
  std::uint32_t task_depth{0};
  // Bumped whenever the entered-task stack changes; invalidates site_cache.
  std::uint64_t context_epoch{0};
  std::array<TaskId, kMaxTaskDepth> task_stack{};
  std::array<SiteCacheEntry, kSiteCacheSize> site_cache{};

  void reset() noexcept;
  void clear() noexcept;

  // Innermost entered task, or kNoTask.
  TaskId active_task() const noexcept {
    return task_depth == 0 ? kNoTask : task_stack[task_depth - 1];
  }
  // False when the stack is full; the task is not entered.
  bool push_task(TaskId id) noexcept;
  // Pops `id` if it is the innermost task. Returns false on a LIFO violation,
  // in which case the most recent occurrence of `id` is removed instead.
  bool pop_task(TaskId id) noexcept;

  const SiteCacheEntry* lookup_site(const void* site, std::uint64_t generation) const noexcept;
  void remember_site(const void* site, std::uint64_t generation, AllocatorKind kind) noexcept;
};

// Fixed pool of per-thread states indexed by a thread-local slot number.
// Constant-initialized and never destroyed, so it stays valid for threads that
// exit during static destruction.
class ThreadStateArena final {
 public:
  constexpr ThreadStateArena() noexcept = default;
  ThreadStateArena(const ThreadStateArena&) = delete;
  ThreadStateArena& operator=(const ThreadStateArena&) = delete;

  static ThreadStateArena& instance() noexcept;

  // Calling thread's state; claims a slot on first use. nullptr when the
  // thread is torn down, mid-initialization, or the arena is exhausted.
  ThreadAllocatorState* current_or_init() noexcept;
  // Like current_or_init() but never initializes.
  ThreadAllocatorState* current() noexcept;

  ThreadPhase phase() const noexcept;

  // Idempotent. Moves the calling thread to TornDown and releases its slot.
  // Runs automatically from a thread_local destructor at thread exit.
  void teardown_current_thread() noexcept;

  std::size_t slots_in_use() const noexcept { return in_use_.load(std::memory_order_relaxed); }
  static constexpr std::size_t capacity() noexcept { return kMaxThreadSlots; }

 private:
  struct Slot {
    std::atomic<bool> claimed{false};
    ThreadAllocatorState state{};
  };

  int claim_slot_() noexcept;
  void release_slot_(int idx) noexcept;

  std::array<Slot, kMaxThreadSlots> slots_{};
  std::atomic<std::size_t> hint_{0};
  std::atomic<std::size_t> in_use_{0};
};

}} // namespace memprof::alloc
