// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "memprof/alloc/dispatcher.h"

#include <bit>
#include <cstdlib>
#include <cstring>
#include <limits>

#include "memprof/alloc/safe_access.h"
#include "memprof/alloc/thread_state.h"
#include "memprof/alloc/detail/session.h"
#include "memprof/alloc/detail/stats_internal.h"
#include "memprof/logging/logging.h"

namespace memprof { namespace alloc {

namespace {

constexpr std::uint32_t kMagic = 0x4d50524fu;  // "MPRO"
constexpr std::uint32_t kFreed = 0x46524545u;  // "FREE"

inline bool is_pow2(std::size_t v) noexcept { return v != 0 && (v & (v - 1)) == 0; }

// 0 for an unusable alignment.
inline std::size_t effective_alignment(std::size_t alignment) noexcept {
  if (alignment < Dispatcher::kDefaultAlignment) alignment = Dispatcher::kDefaultAlignment;
  if (!is_pow2(alignment) || alignment > std::numeric_limits<std::uint32_t>::max()) return 0;
  return alignment;
}

// Bytes between the system block and the user pointer: the header rounded up
// to the first aligned address.
inline std::size_t header_offset(std::size_t alignment) noexcept {
  return ((sizeof(AllocHeader) + alignment - 1) / alignment) * alignment;
}

inline AllocHeader* header_of(void* p) noexcept {
  return reinterpret_cast<AllocHeader*>(static_cast<char*>(p) - sizeof(AllocHeader));
}
inline const AllocHeader* header_of(const void* p) noexcept {
  return reinterpret_cast<const AllocHeader*>(static_cast<const char*>(p) - sizeof(AllocHeader));
}

void* os_alloc(std::size_t nbytes, std::size_t alignment) noexcept {
  if (alignment <= Dispatcher::kDefaultAlignment) return std::malloc(nbytes);
  void* p = nullptr;
  if (posix_memalign(&p, alignment, nbytes) != 0) return nullptr;
  return p;
}

void os_free(void* p) noexcept {
  if (!p) return;
  std::free(p);
}

// Allocates a block with room for the header and stamps it.
void* alloc_block(std::size_t nbytes, std::size_t alignment, AllocatorKind kind, TaskId task) noexcept {
  MEMPROF_ASSERT(is_pow2(alignment));
  const std::size_t offset = header_offset(alignment);
  if (nbytes > std::numeric_limits<std::size_t>::max() - offset) return nullptr;
  char* base = static_cast<char*>(os_alloc(nbytes + offset, alignment));
  if (!base) return nullptr;
  void* user = base + offset;
  AllocHeader* h = header_of(user);
  h->magic = kMagic;
  h->kind = kind;
  std::memset(h->pad, 0, sizeof(h->pad));
  h->align_log2 = static_cast<std::uint8_t>(std::countr_zero(alignment));
  h->size = nbytes;
  h->task = kind == AllocatorKind::TaskTracked ? task : kNoTask;
  h->entry = kAnyEntry;
  return user;
}

void* alloc_passthrough(std::size_t nbytes, std::size_t alignment) noexcept {
  void* p = alloc_block(nbytes, alignment, AllocatorKind::Passthrough, kNoTask);
  if (p) _stats_passthrough_allocation();
  return p;
}

// Marks the calling thread as inside the dispatcher; nested hook calls see it
// and go straight to the system allocator.
class DispatchFlag final {
 public:
  explicit DispatchFlag(ThreadAllocatorState& st) noexcept : st_(st) { st_.in_dispatch = true; }
  ~DispatchFlag() noexcept { st_.in_dispatch = false; }
  DispatchFlag(const DispatchFlag&) = delete;
  DispatchFlag& operator=(const DispatchFlag&) = delete;

 private:
  ThreadAllocatorState& st_;
};

// Decision for a request on a thread that has state and a live session.
AllocatorKind resolve(ThreadAllocatorState& st, detail::Session& s, std::size_t nbytes,
                      const void* site) noexcept {
  if (st.active_task() == kNoTask) return AllocatorKind::Passthrough;
  if (nbytes <= s.config.size_threshold) return AllocatorKind::Passthrough;
  if (st.override_depth > 0) return st.current_kind;

  const std::uint64_t gen = s.classifier.generation();
  if (site) {
    if (const SiteCacheEntry* e = st.lookup_site(site, gen)) {
      _stats_classifier_cache_hit();
      return e->kind;
    }
  }
  const AllocatorKind kind = s.classifier.classify(st);
  if (site) st.remember_site(site, gen, kind);
  return kind;
}

// Thread state for a hook call that is allowed to touch the registry, or
// nullptr (with the fallback reason counted).
ThreadAllocatorState* enter_hook() noexcept {
  ThreadAllocatorState* st = acquire_thread_state();
  if (!st) return nullptr;
  if (st->in_dispatch) {
    _stats_reentrant_fallback();
    return nullptr;
  }
  return st;
}

} // namespace

void* Dispatcher::allocate(std::size_t nbytes, std::size_t alignment, const void* site) noexcept {
  const std::size_t a = effective_alignment(alignment);
  if (a == 0) return nullptr;
  if (!detail::enabled_fast()) return alloc_passthrough(nbytes, a);

  ThreadAllocatorState* st = enter_hook();
  if (!st) return alloc_passthrough(nbytes, a);
  DispatchFlag flag(*st);

  detail::SessionPin pin;
  if (!pin) return alloc_passthrough(nbytes, a);

  const TaskId task = st->active_task();
  if (resolve(*st, *pin.get(), nbytes, site) != AllocatorKind::TaskTracked) return alloc_passthrough(nbytes, a);

  void* p = alloc_block(nbytes, a, AllocatorKind::TaskTracked, task);
  if (!p) return nullptr;
  AllocHeader* h = header_of(p);
  EntrySerial charged = kAnyEntry;
  const RecordStatus rs = pin->registry.record(TaskHandle{task}, nbytes, RecordEvent::Allocate, &charged);
  if (rs != RecordStatus::Recorded) {
    // Not counted by the task, so its free must not be either.
    h->kind = AllocatorKind::Passthrough;
    h->task = kNoTask;
    _stats_demoted_allocation();
    _stats_passthrough_allocation();
    return p;
  }
  h->entry = charged;
  _stats_tracked_allocation();
  return p;
}

void Dispatcher::deallocate(void* p) noexcept {
  if (!p) return;
  AllocHeader* h = header_of(p);
  if (h->magic != kMagic) {
    // Foreign or already-freed pointer; leak rather than corrupt the heap.
    _stats_state_access_failure();
    return;
  }
  const AllocatorKind kind = h->kind;
  const TaskId task = h->task;
  const EntrySerial entry = h->entry;
  const std::size_t size = static_cast<std::size_t>(h->size);
  void* base = static_cast<char*>(p) - header_offset(std::size_t{1} << h->align_log2);
  h->magic = kFreed;

  bool recorded = false;
  if (kind == AllocatorKind::TaskTracked && task != kNoTask && detail::enabled_fast()) {
    if (ThreadAllocatorState* st = enter_hook()) {
      DispatchFlag flag(*st);
      detail::SessionPin pin;
      if (pin) {
        // A purged-and-rebegun id, or a new session, no longer matches `entry`.
        recorded = pin->registry.record(TaskHandle{task, entry}, size, RecordEvent::Free) == RecordStatus::Recorded;
      }
    }
  }
  if (recorded) _stats_tracked_free();
  else _stats_passthrough_free();
  os_free(base);
}

void* Dispatcher::reallocate(void* p, std::size_t nbytes, const void* site) noexcept {
  if (!p) return allocate(nbytes, kDefaultAlignment, site);
  if (nbytes == 0) {
    deallocate(p);
    return nullptr;
  }
  const AllocHeader* h = header_of(p);
  if (h->magic != kMagic) {
    _stats_state_access_failure();
    return nullptr;
  }
  const std::size_t old_size = static_cast<std::size_t>(h->size);
  void* q = allocate(nbytes, std::size_t{1} << h->align_log2, site);
  if (!q) return nullptr;
  std::memcpy(q, p, old_size < nbytes ? old_size : nbytes);
  deallocate(p);
  return q;
}

AllocatorKind Dispatcher::resolve_kind(std::size_t nbytes, const void* site) noexcept {
  if (!detail::enabled_fast()) return AllocatorKind::Passthrough;
  ThreadAllocatorState* st = enter_hook();
  if (!st) return AllocatorKind::Passthrough;
  DispatchFlag flag(*st);
  detail::SessionPin pin;
  if (!pin) return AllocatorKind::Passthrough;
  return resolve(*st, *pin.get(), nbytes, site);
}

bool Dispatcher::owns(const void* p) noexcept {
  return p != nullptr && header_of(p)->magic == kMagic;
}

AllocatorKind Dispatcher::backend_of(const void* p) noexcept { return header_of(p)->kind; }

TaskId Dispatcher::task_of(const void* p) noexcept { return header_of(p)->task; }

EntrySerial Dispatcher::entry_of(const void* p) noexcept { return header_of(p)->entry; }

std::size_t Dispatcher::requested_size(const void* p) noexcept {
  return static_cast<std::size_t>(header_of(p)->size);
}

}} // namespace memprof::alloc
