// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <type_traits>

#include "memprof/alloc/kind.h"

namespace memprof { namespace alloc {

// RAII override of the calling thread's allocator kind. Guards nest and must
// be released in LIFO order on the thread that created them.
//
// If the thread state is unavailable (arena exhausted, thread torn down) the
// guard is inert: it neither pushes nor pops.
class ScopeGuard final {
 public:
  explicit ScopeGuard(AllocatorKind kind) noexcept;
  ~ScopeGuard() noexcept;

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  bool engaged() const noexcept { return engaged_; }
  AllocatorKind kind() const noexcept { return kind_; }

 private:
  AllocatorKind kind_;
  AllocatorKind prev_{AllocatorKind::TaskTracked};
  std::uint32_t depth_{0};
  bool engaged_{false};
};

static_assert(std::is_nothrow_destructible_v<ScopeGuard>, "ScopeGuard dtor must be noexcept");

[[nodiscard]] inline ScopeGuard enter_scope(AllocatorKind kind) noexcept { return ScopeGuard(kind); }

// Kind forced by the innermost live guard, or the thread's base kind when no
// guard is live. Passthrough when the thread state is unavailable.
AllocatorKind current_kind() noexcept;
std::uint32_t override_depth() noexcept;

}} // namespace memprof::alloc
