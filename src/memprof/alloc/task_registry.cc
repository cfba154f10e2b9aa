// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "memprof/alloc/task_registry.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "memprof/alloc/safe_access.h"
#include "memprof/alloc/scope_guard.h"
#include "memprof/logging/logging.h"

namespace memprof { namespace alloc {

static std::atomic<EntrySerial> g_next_entry_serial{1};

static const bool kLogRegistry = [](){ const char* v = std::getenv("MEMPROF_LOG_REGISTRY"); return v && std::strcmp(v, "1") == 0; }();

const char* to_string(RecordStatus s) noexcept {
  switch (s) {
    case RecordStatus::Recorded: return "Recorded";
    case RecordStatus::Sealed: return "Sealed";
    case RecordStatus::UnknownTask: return "UnknownTask";
    case RecordStatus::LockTimeout: return "LockTimeout";
  }
  return "?";
}

TaskStats TaskStatsRegistry::Entry::load() const noexcept {
  TaskStats s;
  s.bytes_allocated = bytes_allocated.load(std::memory_order_relaxed);
  s.bytes_freed = bytes_freed.load(std::memory_order_relaxed);
  s.peak_bytes = peak_bytes.load(std::memory_order_relaxed);
  s.allocation_events = allocation_events.load(std::memory_order_relaxed);
  const std::int64_t live = live_allocations.load(std::memory_order_relaxed);
  s.live_allocations = live > 0 ? static_cast<std::uint64_t>(live) : 0;
  return s;
}

TaskStatsRegistry::TaskStatsRegistry(std::chrono::microseconds lock_budget, bool log_sealed_writes)
    : lock_budget_(lock_budget), log_sealed_writes_(log_sealed_writes) {}

TaskStatsRegistry::~TaskStatsRegistry() {
  ScopeGuard pass(AllocatorKind::Passthrough);
  entries_.clear();
}

TaskHandle TaskStatsRegistry::begin_task(TaskId id) {
  if (id == kNoTask) {
    throw std::invalid_argument("TaskStatsRegistry::begin_task: task id 0 is reserved");
  }
  ScopeGuard pass(AllocatorKind::Passthrough);
  EntrySerial serial = kAnyEntry;
  {
    std::unique_lock<std::shared_timed_mutex> lk(mu_);
    if (entries_.find(id) != entries_.end()) {
      throw std::invalid_argument("TaskStatsRegistry::begin_task: task " + std::to_string(id) + " already exists");
    }
    serial = g_next_entry_serial.fetch_add(1, std::memory_order_relaxed);
    const bool inserted = entries_.emplace(id, std::make_unique<Entry>(serial)).second;
    MEMPROF_CHECK(inserted);
  }
  tasks_begun_.fetch_add(1, std::memory_order_relaxed);
  if (kLogRegistry) { MEMPROF_LOG(INFO) << "[memprof][registry] begin task " << id << " entry " << serial; }
  return TaskHandle{id, serial};
}

RecordStatus TaskStatsRegistry::record(TaskHandle h, std::size_t nbytes, RecordEvent ev,
                                       EntrySerial* charged) noexcept {
  auto lk = lock_shared_within(mu_, lock_budget_);
  if (!lk.owns_lock()) {
    missed_updates_.fetch_add(1, std::memory_order_relaxed);
    return RecordStatus::LockTimeout;
  }
  auto it = entries_.find(h.id);
  if (it == entries_.end() || (h.entry != kAnyEntry && it->second->serial != h.entry)) {
    lk.unlock();
    unknown_task_writes_.fetch_add(1, std::memory_order_relaxed);
    return RecordStatus::UnknownTask;
  }
  Entry& e = *it->second;
  if (e.sealed) {
    lk.unlock();
    note_sealed_write_(h.id);
    return RecordStatus::Sealed;
  }
  const auto n = static_cast<std::int64_t>(nbytes);
  if (ev == RecordEvent::Allocate) {
    const std::int64_t now = e.live_bytes.fetch_add(n, std::memory_order_acq_rel) + n;
    if (now > 0) {
      const auto now_u = static_cast<std::uint64_t>(now);
      std::uint64_t cur = e.peak_bytes.load(std::memory_order_relaxed);
      while (now_u > cur && !e.peak_bytes.compare_exchange_weak(cur, now_u, std::memory_order_relaxed)) {
      }
    }
    e.bytes_allocated.fetch_add(nbytes, std::memory_order_relaxed);
    e.live_allocations.fetch_add(1, std::memory_order_relaxed);
    e.allocation_events.fetch_add(1, std::memory_order_relaxed);
  } else {
    e.live_bytes.fetch_sub(n, std::memory_order_acq_rel);
    e.bytes_freed.fetch_add(nbytes, std::memory_order_relaxed);
    e.live_allocations.fetch_sub(1, std::memory_order_relaxed);
  }
  if (charged) *charged = e.serial;
  return RecordStatus::Recorded;
}

void TaskStatsRegistry::note_sealed_write_(TaskId id) noexcept {
  sealed_writes_.fetch_add(1, std::memory_order_relaxed);
  if (!log_sealed_writes_) return;
  if (ThreadStateArena::instance().phase() != ThreadPhase::Active) return;
  ScopeGuard pass(AllocatorKind::Passthrough);
  contain<bool>([&] {
    LOG_FIRST_N(WARNING, 8) << "[memprof][registry] record for task " << id
                            << " after end_task was rejected";
    return true;
  }, false);
}

TaskStats TaskStatsRegistry::end_task(TaskHandle h) {
  TaskStats out;
  bool newly_sealed = false;
  {
    std::unique_lock<std::shared_timed_mutex> lk(mu_);
    auto it = entries_.find(h.id);
    if (it == entries_.end()) {
      lk.unlock();
      ScopeGuard pass(AllocatorKind::Passthrough);
      throw std::out_of_range("TaskStatsRegistry::end_task: unknown task " + std::to_string(h.id));
    }
    if (h.entry != kAnyEntry && it->second->serial != h.entry) {
      lk.unlock();
      ScopeGuard pass(AllocatorKind::Passthrough);
      throw std::out_of_range("TaskStatsRegistry::end_task: handle for task " + std::to_string(h.id) +
                              " refers to a purged entry");
    }
    Entry& e = *it->second;
    if (!e.sealed) {
      e.snapshot = e.load();
      e.sealed = true;
      newly_sealed = true;
    }
    out = e.snapshot;
  }
  if (newly_sealed) {
    tasks_ended_.fetch_add(1, std::memory_order_relaxed);
  }
  if (newly_sealed && kLogRegistry) {
    ScopeGuard pass(AllocatorKind::Passthrough);
    MEMPROF_LOG(INFO) << "[memprof][registry] end task " << h.id << ": allocated=" << out.bytes_allocated
            << " freed=" << out.bytes_freed << " peak=" << out.peak_bytes
            << " live=" << out.live_allocations;
  }
  return out;
}

std::optional<TaskStats> TaskStatsRegistry::live_stats(TaskId id) const {
  std::shared_lock<std::shared_timed_mutex> lk(mu_);
  auto it = entries_.find(id);
  if (it == entries_.end()) return std::nullopt;
  const Entry& e = *it->second;
  return e.sealed ? e.snapshot : e.load();
}

std::optional<TaskStats> TaskStatsRegistry::sealed_stats(TaskId id) const {
  std::shared_lock<std::shared_timed_mutex> lk(mu_);
  auto it = entries_.find(id);
  if (it == entries_.end() || !it->second->sealed) return std::nullopt;
  return it->second->snapshot;
}

bool TaskStatsRegistry::contains(TaskId id) const {
  std::shared_lock<std::shared_timed_mutex> lk(mu_);
  return entries_.find(id) != entries_.end();
}

bool TaskStatsRegistry::is_sealed(TaskId id) const {
  std::shared_lock<std::shared_timed_mutex> lk(mu_);
  auto it = entries_.find(id);
  return it != entries_.end() && it->second->sealed;
}

std::vector<TaskId> TaskStatsRegistry::active_tasks() const {
  ScopeGuard pass(AllocatorKind::Passthrough);
  std::vector<std::pair<std::uint64_t, TaskId>> ordered;
  {
    std::shared_lock<std::shared_timed_mutex> lk(mu_);
    ordered.reserve(entries_.size());
    for (const auto& [id, e] : entries_) {
      if (!e->sealed) ordered.emplace_back(e->serial, id);
    }
  }
  std::sort(ordered.begin(), ordered.end());
  std::vector<TaskId> out;
  out.reserve(ordered.size());
  for (const auto& p : ordered) out.push_back(p.second);
  return out;
}

std::optional<TaskId> TaskStatsRegistry::last_active_task() const {
  std::shared_lock<std::shared_timed_mutex> lk(mu_);
  std::optional<TaskId> best;
  std::uint64_t best_order = 0;
  for (const auto& [id, e] : entries_) {
    if (e->sealed) continue;
    if (!best || e->serial > best_order) {
      best = id;
      best_order = e->serial;
    }
  }
  return best;
}

bool TaskStatsRegistry::purge(TaskId id) {
  ScopeGuard pass(AllocatorKind::Passthrough);
  {
    std::unique_lock<std::shared_timed_mutex> lk(mu_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    if (it->second->sealed) {
      entries_.erase(it);
      lk.unlock();
      tasks_purged_.fetch_add(1, std::memory_order_relaxed);
      return true;
    }
  }
  throw std::logic_error("TaskStatsRegistry::purge: task " + std::to_string(id) + " has not ended");
}

std::size_t TaskStatsRegistry::purge_sealed() {
  ScopeGuard pass(AllocatorKind::Passthrough);
  std::size_t n = 0;
  {
    std::unique_lock<std::shared_timed_mutex> lk(mu_);
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second->sealed) {
        it = entries_.erase(it);
        ++n;
      } else {
        ++it;
      }
    }
  }
  tasks_purged_.fetch_add(n, std::memory_order_relaxed);
  return n;
}

std::size_t TaskStatsRegistry::size() const {
  std::shared_lock<std::shared_timed_mutex> lk(mu_);
  return entries_.size();
}

RegistryDiagnostics TaskStatsRegistry::diagnostics() const noexcept {
  RegistryDiagnostics d;
  d.missed_updates = missed_updates_.load(std::memory_order_relaxed);
  d.sealed_writes = sealed_writes_.load(std::memory_order_relaxed);
  d.unknown_task_writes = unknown_task_writes_.load(std::memory_order_relaxed);
  d.tasks_begun = tasks_begun_.load(std::memory_order_relaxed);
  d.tasks_ended = tasks_ended_.load(std::memory_order_relaxed);
  d.tasks_purged = tasks_purged_.load(std::memory_order_relaxed);
  return d;
}

}} // namespace memprof::alloc
