// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

#include "memprof/alloc/kind.h"
#include "memprof/alloc/task_registry.h"

namespace memprof { namespace alloc {

// Metadata stored immediately before every pointer the dispatcher returns.
// `kind` records the backend that serviced the block so frees are routed (and
// attributed) independently of the freeing thread's state. `entry` pins the
// free to the registry entry that was charged, even if `task` is later reused.
struct AllocHeader {
  std::uint32_t magic;
  AllocatorKind kind;
  std::uint8_t  align_log2;  // effective alignment of the user pointer
  std::uint8_t  pad[2];
  std::uint64_t size;        // requested bytes
  TaskId        task;        // kNoTask unless kind == TaskTracked
  EntrySerial   entry;       // kAnyEntry unless kind == TaskTracked
};

static_assert(sizeof(AllocHeader) == 32, "AllocHeader must stay 32 bytes");

// Allocation hot path. Stateless; all state lives in the calling thread's
// ThreadAllocatorState and the current profiling session.
//
// No profiling failure reaches the caller: lookups that fail degrade to
// Passthrough, registry updates that fail demote the block to Passthrough.
// allocate() returns nullptr only when the system allocator does, or for an
// invalid alignment.
class Dispatcher final {
 public:
  static constexpr std::size_t kDefaultAlignment = alignof(std::max_align_t);

  // `alignment` must be a power of two (values below kDefaultAlignment are
  // raised). `site` keys the per-thread decision cache; nullptr disables
  // caching for this call.
  static void* allocate(std::size_t nbytes, std::size_t alignment = kDefaultAlignment,
                        const void* site = nullptr) noexcept;
  static void  deallocate(void* p) noexcept;
  // Alloc-copy-free with the original block's alignment. nbytes == 0 frees and
  // returns nullptr. On failure the original block is left untouched.
  static void* reallocate(void* p, std::size_t nbytes, const void* site = nullptr) noexcept;

  // Decision allocate() would make for an nbytes request from `site` on the
  // calling thread, without allocating.
  static AllocatorKind resolve_kind(std::size_t nbytes, const void* site = nullptr) noexcept;

  // True when the header before `p` carries the dispatcher magic. Reads the
  // sizeof(AllocHeader) bytes preceding `p`.
  static bool          owns(const void* p) noexcept;
  // `p` must be a live pointer returned by this dispatcher.
  static AllocatorKind backend_of(const void* p) noexcept;
  static TaskId        task_of(const void* p) noexcept;
  static EntrySerial   entry_of(const void* p) noexcept;
  static std::size_t   requested_size(const void* p) noexcept;
};

}} // namespace memprof::alloc
