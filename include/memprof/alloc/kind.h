// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace memprof { namespace alloc {

// Which backend services an allocation request.
// - Passthrough: no bookkeeping (instrumentation internals, teardown, failures).
// - TaskTracked: size deltas are recorded against the thread's active task.
enum class AllocatorKind : std::uint8_t {
  Passthrough = 0,
  TaskTracked = 1,
};

inline constexpr const char* to_string(AllocatorKind k) noexcept {
  return k == AllocatorKind::TaskTracked ? "TaskTracked" : "Passthrough";
}

// Caller-supplied identity of a unit of tracked work. Zero is reserved.
using TaskId = std::uint64_t;
inline constexpr TaskId kNoTask = 0;

}} // namespace memprof::alloc
