// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <exception>
#include <mutex>
#include <shared_mutex>
#include <utility>

#include "memprof/alloc/thread_state.h"
#include "memprof/alloc/detail/stats_internal.h"

namespace memprof { namespace alloc {

// Contained-failure boundary for code reachable from the allocation path.
// Any exception escaping `fn` is counted as a state access failure and
// converted into `fallback`; nothing unwinds into the caller.
template <class T, class Fn>
T contain(Fn&& fn, T fallback) noexcept {
  try {
    return std::forward<Fn>(fn)();
  } catch (const std::exception&) {
    _stats_state_access_failure();
  } catch (...) {
    _stats_state_access_failure();
  }
  return fallback;
}

// Calling thread's state, created on first use. nullptr (with the reason
// counted) when the thread is torn down or the state cannot be created.
inline ThreadAllocatorState* acquire_thread_state() noexcept {
  ThreadStateArena& arena = ThreadStateArena::instance();
  ThreadAllocatorState* st = arena.current_or_init();
  if (!st) {
    if (arena.phase() == ThreadPhase::TornDown) _stats_torn_down_fallback();
    else _stats_state_access_failure();
  }
  return st;
}

// Timeout-guarded lock acquisition. The returned lock does not own the mutex
// when the budget elapsed; callers drop their update instead of retrying.
template <class M>
std::shared_lock<M> lock_shared_within(M& mu, std::chrono::microseconds budget) noexcept {
  try {
    if (budget.count() <= 0) return std::shared_lock<M>(mu, std::try_to_lock);
    return std::shared_lock<M>(mu, budget);
  } catch (const std::exception&) {
    _stats_state_access_failure();
  }
  return std::shared_lock<M>();
}

}} // namespace memprof::alloc
