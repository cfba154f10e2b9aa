// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "memprof/alloc/profiler.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "memprof/alloc/detail/session.h"
#include "memprof/alloc/detail/stats_internal.h"
#include "memprof/alloc/thread_state.h"
#include "memprof/logging/logging.h"

namespace memprof { namespace alloc {

namespace detail {

namespace {
std::atomic<Session*> g_session{nullptr};
std::atomic<std::uint64_t> g_pins{0};
std::atomic<bool> g_enabled{false};
} // namespace

Session::Session(const Config& cfg, StackInspector* inspector)
    : config(cfg),
      registry(cfg.lock_timeout, cfg.log_sealed_writes),
      classifier(CallSiteClassifier::Options{cfg.classifier_fallback, cfg.classifier_max_frames, cfg.internal_patterns},
                 inspector) {}

SessionPin::SessionPin() noexcept {
  g_pins.fetch_add(1, std::memory_order_seq_cst);
  s_ = g_session.load(std::memory_order_seq_cst);
  if (!s_) g_pins.fetch_sub(1, std::memory_order_release);
}

SessionPin::~SessionPin() noexcept {
  if (s_) g_pins.fetch_sub(1, std::memory_order_release);
}

bool enabled_fast() noexcept { return g_enabled.load(std::memory_order_relaxed); }

} // namespace detail

namespace {

std::mutex g_control_mu;
std::atomic<TaskId> g_next_task_id{1};

[[noreturn]] void throw_disabled(const char* what) {
  throw std::logic_error(std::string(what) + ": memory profiling is not enabled");
}

} // namespace

bool enable(const Config& cfg) { return enable(cfg, nullptr); }

bool enable(const Config& cfg, StackInspector* inspector) {
  std::lock_guard<std::mutex> lg(g_control_mu);
  if (detail::g_session.load(std::memory_order_acquire) != nullptr) {
    MEMPROF_LOG(WARNING) << "[memprof] enable() called while profiling is already enabled; ignored";
    return false;
  }
  detail::Session* s = nullptr;
  {
    ScopeGuard pass(AllocatorKind::Passthrough);
    s = new detail::Session(cfg, inspector);
    MEMPROF_LOG(INFO) << "[memprof] profiling enabled: lock_timeout_us=" << cfg.lock_timeout.count()
                      << " size_threshold=" << cfg.size_threshold
                      << " classifier_fallback=" << (cfg.classifier_fallback ? 1 : 0);
  }
  detail::g_session.store(s, std::memory_order_seq_cst);
  detail::g_enabled.store(true, std::memory_order_release);
  return true;
}

bool enable_from_env() {
  Config cfg = config_from_env();
  if (!cfg.enabled) return false;
  return enable(cfg);
}

void disable() noexcept {
  std::lock_guard<std::mutex> lg(g_control_mu);
  detail::g_enabled.store(false, std::memory_order_release);
  detail::Session* s = detail::g_session.exchange(nullptr, std::memory_order_seq_cst);
  if (!s) return;
  // Pins are held only across bounded dispatcher bookkeeping.
  while (detail::g_pins.load(std::memory_order_acquire) != 0) {
    std::this_thread::yield();
  }
  ScopeGuard pass(AllocatorKind::Passthrough);
  const RegistryDiagnostics d = s->registry.diagnostics();
  delete s;
  MEMPROF_LOG(INFO) << "[memprof] profiling disabled: tasks_begun=" << d.tasks_begun
                    << " tasks_ended=" << d.tasks_ended << " missed_updates=" << d.missed_updates
                    << " sealed_writes=" << d.sealed_writes;
}

bool is_enabled() noexcept { return detail::enabled_fast(); }

TaskId next_task_id() noexcept { return g_next_task_id.fetch_add(1, std::memory_order_relaxed); }

TaskHandle begin_task(TaskId id) {
  detail::SessionPin pin;
  if (!pin) throw_disabled("begin_task");
  return pin->registry.begin_task(id);
}

TaskHandle begin_task() { return begin_task(next_task_id()); }

TaskStats end_task(TaskHandle h) {
  detail::SessionPin pin;
  if (!pin) throw_disabled("end_task");
  return pin->registry.end_task(h);
}

std::optional<TaskStats> task_stats(TaskId id) {
  detail::SessionPin pin;
  if (!pin) return std::nullopt;
  return pin->registry.live_stats(id);
}

std::vector<TaskId> active_tasks() {
  detail::SessionPin pin;
  if (!pin) return {};
  return pin->registry.active_tasks();
}

std::optional<TaskId> last_active_task() {
  detail::SessionPin pin;
  if (!pin) return std::nullopt;
  return pin->registry.last_active_task();
}

bool purge_task(TaskId id) {
  detail::SessionPin pin;
  if (!pin) throw_disabled("purge_task");
  return pin->registry.purge(id);
}

std::size_t purge_sealed_tasks() {
  detail::SessionPin pin;
  if (!pin) throw_disabled("purge_sealed_tasks");
  return pin->registry.purge_sealed();
}

RegistryDiagnostics registry_diagnostics() {
  detail::SessionPin pin;
  if (!pin) return RegistryDiagnostics{};
  return pin->registry.diagnostics();
}

TaskScope::TaskScope(TaskHandle h) noexcept : id_(h.id) {
  if (!h.valid()) return;
  ThreadAllocatorState* st = ThreadStateArena::instance().current_or_init();
  if (!st) return;
  entered_ = st->push_task(h.id);
}

TaskScope::~TaskScope() noexcept {
  if (!entered_) return;
  ThreadAllocatorState* st = ThreadStateArena::instance().current();
  if (!st) return;
  if (!st->pop_task(id_)) _stats_scope_order_violation();
}

TaskId current_task() noexcept {
  ThreadAllocatorState* st = ThreadStateArena::instance().current();
  return st ? st->active_task() : kNoTask;
}

}} // namespace memprof::alloc
