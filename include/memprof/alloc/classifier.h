// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "memprof/alloc/kind.h"

namespace memprof { namespace alloc {

struct ThreadAllocatorState;
class StackInspector;

// Decides the allocator kind for a call site with no explicit override.
//
// Tier 1 (authoritative): explicit scope markers. Instrumentation code brackets
// its bookkeeping with enter_scope(); while such a scope is live the thread's
// override kind is the answer.
// Tier 2 (heuristic): walk a best-effort stack snapshot and report Passthrough
// if any frame outside the allocation hook itself contains one of the
// configured internal patterns. An unavailable or unresolvable stack is
// reported as TaskTracked.
class CallSiteClassifier final {
 public:
  struct Options {
    bool fallback_enabled{true};
    std::size_t max_frames{32};
    std::vector<std::string> internal_patterns{};
  };

  // `inspector` == nullptr selects default_stack_inspector().
  explicit CallSiteClassifier(Options opts, StackInspector* inspector = nullptr);

  AllocatorKind classify(const ThreadAllocatorState& st) noexcept;
  AllocatorKind classify_stack() noexcept;

  // Unique per instance; tags per-thread cached decisions.
  std::uint64_t generation() const noexcept { return generation_; }
  const Options& options() const noexcept { return opts_; }

 private:
  Options opts_;
  StackInspector* inspector_;
  std::uint64_t generation_;
};

}} // namespace memprof::alloc
