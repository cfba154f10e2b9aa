// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "memprof/alloc/scope_guard.h"

#include "memprof/alloc/thread_state.h"
#include "memprof/alloc/detail/stats_internal.h"

namespace memprof { namespace alloc {

ScopeGuard::ScopeGuard(AllocatorKind kind) noexcept : kind_(kind) {
  ThreadAllocatorState* st = ThreadStateArena::instance().current_or_init();
  if (!st) return;
  prev_ = st->current_kind;
  st->current_kind = kind;
  depth_ = ++st->override_depth;
  engaged_ = true;
}

ScopeGuard::~ScopeGuard() noexcept {
  if (!engaged_) return;
  // Re-fetch: the slot may have been released (and reused) since construction.
  ThreadAllocatorState* st = ThreadStateArena::instance().current();
  if (!st) return;
  if (st->override_depth != depth_) _stats_scope_order_violation();
  if (st->override_depth > 0) --st->override_depth;
  st->current_kind = prev_;
}

AllocatorKind current_kind() noexcept {
  ThreadAllocatorState* st = ThreadStateArena::instance().current_or_init();
  return st ? st->current_kind : AllocatorKind::Passthrough;
}

std::uint32_t override_depth() noexcept {
  ThreadAllocatorState* st = ThreadStateArena::instance().current();
  return st ? st->override_depth : 0;
}

}} // namespace memprof::alloc
