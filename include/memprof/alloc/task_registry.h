// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "memprof/alloc/kind.h"

namespace memprof { namespace alloc {

struct TaskStats {
  std::uint64_t bytes_allocated{0};
  std::uint64_t bytes_freed{0};
  // High-water mark of bytes_allocated - bytes_freed.
  std::uint64_t peak_bytes{0};
  std::uint64_t live_allocations{0};
  std::uint64_t allocation_events{0};

  std::int64_t net_bytes() const noexcept {
    return static_cast<std::int64_t>(bytes_allocated) - static_cast<std::int64_t>(bytes_freed);
  }
  bool operator==(const TaskStats&) const = default;
};

enum class RecordEvent : std::uint8_t {
  Allocate = 0,
  Free = 1,
};

enum class RecordStatus : std::uint8_t {
  Recorded = 0,
  Sealed = 1,       // task already ended; update rejected
  UnknownTask = 2,  // never begun, purged, or the handle names an older entry
  LockTimeout = 3,  // registry lock not acquired within budget; update dropped
};

const char* to_string(RecordStatus s) noexcept;

// Identifies one registry entry. Task ids may be reused (after purge, or in a
// later session); entry serials are process-unique and never reused.
using EntrySerial = std::uint64_t;
inline constexpr EntrySerial kAnyEntry = 0;

struct TaskHandle {
  TaskId id{kNoTask};
  // Set by begin_task. kAnyEntry matches whichever entry currently holds `id`.
  EntrySerial entry{kAnyEntry};
  bool valid() const noexcept { return id != kNoTask; }
};

struct RegistryDiagnostics {
  std::uint64_t missed_updates{0};
  std::uint64_t sealed_writes{0};
  std::uint64_t unknown_task_writes{0};
  std::uint64_t tasks_begun{0};
  std::uint64_t tasks_ended{0};
  std::uint64_t tasks_purged{0};
};

// Process-wide map from task id to allocation counters.
//
// Concurrency:
// - record() holds the map lock shared (timeout-bounded) and updates per-entry
//   atomics, so concurrent writers to one task never lose updates.
// - begin/end/purge hold the lock exclusively. end_task() therefore observes
//   no in-flight record(): updates either land before the seal or are rejected.
// - Entries of ended tasks stay queryable until purged.
class TaskStatsRegistry final {
 public:
  explicit TaskStatsRegistry(std::chrono::microseconds lock_budget, bool log_sealed_writes = true);
  ~TaskStatsRegistry();

  TaskStatsRegistry(const TaskStatsRegistry&) = delete;
  TaskStatsRegistry& operator=(const TaskStatsRegistry&) = delete;

  // Throws std::invalid_argument for kNoTask or an id that already has an entry.
  TaskHandle begin_task(TaskId id);

  // Hot path; never blocks longer than lock_budget(). A handle carrying an
  // entry serial only matches that entry. On Recorded, `charged` (if given)
  // receives the serial of the entry that was updated.
  RecordStatus record(TaskHandle h, std::size_t nbytes, RecordEvent ev, EntrySerial* charged = nullptr) noexcept;

  // Seals the entry and returns its final stats. Idempotent: ending a sealed
  // task returns the same snapshot. Throws std::out_of_range for unknown ids
  // and for handles naming an entry that no longer exists.
  TaskStats end_task(TaskHandle h);

  // Best-effort current stats (sealed snapshot for ended tasks).
  std::optional<TaskStats> live_stats(TaskId id) const;
  // Present only once the task has ended.
  std::optional<TaskStats> sealed_stats(TaskId id) const;

  bool contains(TaskId id) const;
  bool is_sealed(TaskId id) const;

  // Begun and not yet ended, in begin order.
  std::vector<TaskId> active_tasks() const;
  std::optional<TaskId> last_active_task() const;

  // Removes a sealed entry. Returns false for unknown ids; throws
  // std::logic_error for an active task.
  bool purge(TaskId id);
  std::size_t purge_sealed();

  std::size_t size() const;
  RegistryDiagnostics diagnostics() const noexcept;
  std::chrono::microseconds lock_budget() const noexcept { return lock_budget_; }

#if MEMPROF_INTERNAL_TESTS
  std::unique_lock<std::shared_timed_mutex> _test_hold_exclusive() {
    return std::unique_lock<std::shared_timed_mutex>(mu_);
  }
#endif

 private:
  struct Entry {
    explicit Entry(EntrySerial s) noexcept : serial(s) {}

    // Process-unique; also orders entries by begin time.
    const EntrySerial serial;
    std::atomic<std::uint64_t> bytes_allocated{0};
    std::atomic<std::uint64_t> bytes_freed{0};
    std::atomic<std::uint64_t> peak_bytes{0};
    std::atomic<std::uint64_t> allocation_events{0};
    std::atomic<std::int64_t>  live_bytes{0};
    std::atomic<std::int64_t>  live_allocations{0};
    // Guarded by mu_: written under exclusive lock, read under shared lock.
    bool      sealed{false};
    TaskStats snapshot{};

    TaskStats load() const noexcept;
  };

  void note_sealed_write_(TaskId id) noexcept;

  const std::chrono::microseconds lock_budget_;
  const bool log_sealed_writes_;

  mutable std::shared_timed_mutex mu_;
  std::unordered_map<TaskId, std::unique_ptr<Entry>> entries_;

  std::atomic<std::uint64_t> missed_updates_{0};
  std::atomic<std::uint64_t> sealed_writes_{0};
  std::atomic<std::uint64_t> unknown_task_writes_{0};
  std::atomic<std::uint64_t> tasks_begun_{0};
  std::atomic<std::uint64_t> tasks_ended_{0};
  std::atomic<std::uint64_t> tasks_purged_{0};
};

}} // namespace memprof::alloc
