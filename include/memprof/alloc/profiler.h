// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <type_traits>
#include <vector>

#include "memprof/alloc/config.h"
#include "memprof/alloc/kind.h"
#include "memprof/alloc/scope_guard.h"
#include "memprof/alloc/task_registry.h"

namespace memprof { namespace alloc {

class StackInspector;

// Process-wide profiling switch. enable() creates a session (registry and
// classifier); disable() waits for in-flight dispatcher calls and destroys it.
// Returns false and leaves the running session untouched if already enabled.
bool enable(const Config& cfg);
// As above with an explicit stack inspector for the classifier fallback.
bool enable(const Config& cfg, StackInspector* inspector);
// enable(config_from_env()) when the environment sets enabled=1.
bool enable_from_env();
void disable() noexcept;
bool is_enabled() noexcept;

// Process-unique, starting at 1.
TaskId next_task_id() noexcept;

// Control plane. All throw std::logic_error when profiling is disabled.
TaskHandle begin_task(TaskId id);
TaskHandle begin_task();
TaskStats end_task(TaskHandle h);
// Diagnostic read: live stats for an in-progress task, the sealed snapshot for
// an ended one, nullopt when unknown or when profiling is disabled.
std::optional<TaskStats> task_stats(TaskId id);
std::vector<TaskId> active_tasks();
std::optional<TaskId> last_active_task();
bool purge_task(TaskId id);
std::size_t purge_sealed_tasks();
RegistryDiagnostics registry_diagnostics();

// Attributes tracked allocations made on the calling thread to `h` while in
// scope. Scopes nest (innermost wins) and must be released in LIFO order on
// the creating thread. A task may be entered on any number of threads.
class TaskScope final {
 public:
  explicit TaskScope(TaskHandle h) noexcept;
  ~TaskScope() noexcept;

  TaskScope(const TaskScope&) = delete;
  TaskScope& operator=(const TaskScope&) = delete;
  TaskScope(TaskScope&&) = delete;
  TaskScope& operator=(TaskScope&&) = delete;

  bool entered() const noexcept { return entered_; }
  TaskId id() const noexcept { return id_; }

 private:
  TaskId id_;
  bool entered_{false};
};

static_assert(std::is_nothrow_destructible_v<TaskScope>, "TaskScope dtor must be noexcept");

[[nodiscard]] inline TaskScope enter_task(TaskHandle h) noexcept { return TaskScope(h); }

// Innermost task entered on the calling thread, or kNoTask.
TaskId current_task() noexcept;

}} // namespace memprof::alloc
