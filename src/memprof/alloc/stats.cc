// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "memprof/alloc/stats.h"
#include "memprof/alloc/detail/stats_internal.h"
#include <atomic>

namespace memprof { namespace alloc {

static std::atomic<std::uint64_t> g_tracked_allocs{0};
static std::atomic<std::uint64_t> g_pass_allocs{0};
static std::atomic<std::uint64_t> g_tracked_frees{0};
static std::atomic<std::uint64_t> g_pass_frees{0};
static std::atomic<std::uint64_t> g_demoted{0};
static std::atomic<std::uint64_t> g_reentrant{0};
static std::atomic<std::uint64_t> g_torn_down{0};
static std::atomic<std::uint64_t> g_access_failures{0};
static std::atomic<std::uint64_t> g_arena_exhausted{0};
static std::atomic<std::uint64_t> g_classify_calls{0};
static std::atomic<std::uint64_t> g_cache_hits{0};
static std::atomic<std::uint64_t> g_uncertain{0};
static std::atomic<std::uint64_t> g_scope_violations{0};
static std::atomic<std::uint64_t> g_task_overflows{0};

DispatchStatsSnapshot stats() noexcept {
  DispatchStatsSnapshot s;
  s.tracked_allocations = g_tracked_allocs.load(std::memory_order_relaxed);
  s.passthrough_allocations = g_pass_allocs.load(std::memory_order_relaxed);
  s.tracked_frees = g_tracked_frees.load(std::memory_order_relaxed);
  s.passthrough_frees = g_pass_frees.load(std::memory_order_relaxed);
  s.demoted_allocations = g_demoted.load(std::memory_order_relaxed);
  s.reentrant_fallbacks = g_reentrant.load(std::memory_order_relaxed);
  s.torn_down_fallbacks = g_torn_down.load(std::memory_order_relaxed);
  s.state_access_failures = g_access_failures.load(std::memory_order_relaxed);
  s.arena_exhausted = g_arena_exhausted.load(std::memory_order_relaxed);
  s.classifier_invocations = g_classify_calls.load(std::memory_order_relaxed);
  s.classifier_cache_hits = g_cache_hits.load(std::memory_order_relaxed);
  s.classification_uncertain = g_uncertain.load(std::memory_order_relaxed);
  s.scope_order_violations = g_scope_violations.load(std::memory_order_relaxed);
  s.task_stack_overflows = g_task_overflows.load(std::memory_order_relaxed);
  return s;
}

void reset_stats() noexcept {
  g_tracked_allocs.store(0, std::memory_order_relaxed);
  g_pass_allocs.store(0, std::memory_order_relaxed);
  g_tracked_frees.store(0, std::memory_order_relaxed);
  g_pass_frees.store(0, std::memory_order_relaxed);
  g_demoted.store(0, std::memory_order_relaxed);
  g_reentrant.store(0, std::memory_order_relaxed);
  g_torn_down.store(0, std::memory_order_relaxed);
  g_access_failures.store(0, std::memory_order_relaxed);
  g_arena_exhausted.store(0, std::memory_order_relaxed);
  g_classify_calls.store(0, std::memory_order_relaxed);
  g_cache_hits.store(0, std::memory_order_relaxed);
  g_uncertain.store(0, std::memory_order_relaxed);
  g_scope_violations.store(0, std::memory_order_relaxed);
  g_task_overflows.store(0, std::memory_order_relaxed);
}

void _stats_tracked_allocation() noexcept { g_tracked_allocs.fetch_add(1, std::memory_order_relaxed); }
void _stats_passthrough_allocation() noexcept { g_pass_allocs.fetch_add(1, std::memory_order_relaxed); }
void _stats_tracked_free() noexcept { g_tracked_frees.fetch_add(1, std::memory_order_relaxed); }
void _stats_passthrough_free() noexcept { g_pass_frees.fetch_add(1, std::memory_order_relaxed); }
void _stats_demoted_allocation() noexcept { g_demoted.fetch_add(1, std::memory_order_relaxed); }
void _stats_reentrant_fallback() noexcept { g_reentrant.fetch_add(1, std::memory_order_relaxed); }
void _stats_torn_down_fallback() noexcept { g_torn_down.fetch_add(1, std::memory_order_relaxed); }
void _stats_state_access_failure() noexcept { g_access_failures.fetch_add(1, std::memory_order_relaxed); }
void _stats_arena_exhausted() noexcept { g_arena_exhausted.fetch_add(1, std::memory_order_relaxed); }
void _stats_classifier_invoked() noexcept { g_classify_calls.fetch_add(1, std::memory_order_relaxed); }
void _stats_classifier_cache_hit() noexcept { g_cache_hits.fetch_add(1, std::memory_order_relaxed); }
void _stats_classification_uncertain() noexcept { g_uncertain.fetch_add(1, std::memory_order_relaxed); }
void _stats_scope_order_violation() noexcept { g_scope_violations.fetch_add(1, std::memory_order_relaxed); }
void _stats_task_stack_overflow() noexcept { g_task_overflows.fetch_add(1, std::memory_order_relaxed); }

}} // namespace memprof::alloc
