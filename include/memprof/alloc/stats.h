// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>

namespace memprof { namespace alloc {

struct DispatchStatsSnapshot {
  std::uint64_t tracked_allocations{0};
  std::uint64_t passthrough_allocations{0};
  std::uint64_t tracked_frees{0};
  std::uint64_t passthrough_frees{0};
  // Tracked allocations whose registry update was rejected; demoted to Passthrough.
  std::uint64_t demoted_allocations{0};
  // Fallback counters
  std::uint64_t reentrant_fallbacks{0};
  std::uint64_t torn_down_fallbacks{0};
  std::uint64_t state_access_failures{0};
  std::uint64_t arena_exhausted{0};
  // Classifier counters
  std::uint64_t classifier_invocations{0};
  std::uint64_t classifier_cache_hits{0};
  std::uint64_t classification_uncertain{0};
  // Guard discipline
  std::uint64_t scope_order_violations{0};
  std::uint64_t task_stack_overflows{0};
};

// Return a best-effort snapshot of dispatcher counters (not atomic across fields).
DispatchStatsSnapshot stats() noexcept;

// Reset all counters to zero. Other threads may concurrently bump.
void reset_stats() noexcept;

}} // namespace memprof::alloc
