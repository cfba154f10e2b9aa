// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Replaces the global allocation functions with the dispatcher. Linked only
// into binaries that opt in (the memprof_hooks object library); every block
// those binaries allocate with new carries a dispatcher header.

#include <cstddef>
#include <new>

#include "memprof/alloc/dispatcher.h"

namespace {

using memprof::alloc::Dispatcher;

// The caller's return address keys the per-thread decision cache.
#define MEMPROF_CALL_SITE() __builtin_return_address(0)

void* new_impl(std::size_t n, std::size_t alignment, const void* site) {
  for (;;) {
    void* p = Dispatcher::allocate(n, alignment, site);
    if (p) return p;
    std::new_handler h = std::get_new_handler();
    if (!h) throw std::bad_alloc();
    h();
  }
}

void* new_nothrow_impl(std::size_t n, std::size_t alignment, const void* site) noexcept {
  try {
    return new_impl(n, alignment, site);
  } catch (const std::bad_alloc&) {
    return nullptr;
  }
}

} // namespace

void* operator new(std::size_t n) {
  return new_impl(n, Dispatcher::kDefaultAlignment, MEMPROF_CALL_SITE());
}
void* operator new[](std::size_t n) {
  return new_impl(n, Dispatcher::kDefaultAlignment, MEMPROF_CALL_SITE());
}
void* operator new(std::size_t n, const std::nothrow_t&) noexcept {
  return new_nothrow_impl(n, Dispatcher::kDefaultAlignment, MEMPROF_CALL_SITE());
}
void* operator new[](std::size_t n, const std::nothrow_t&) noexcept {
  return new_nothrow_impl(n, Dispatcher::kDefaultAlignment, MEMPROF_CALL_SITE());
}
void* operator new(std::size_t n, std::align_val_t al) {
  return new_impl(n, static_cast<std::size_t>(al), MEMPROF_CALL_SITE());
}
void* operator new[](std::size_t n, std::align_val_t al) {
  return new_impl(n, static_cast<std::size_t>(al), MEMPROF_CALL_SITE());
}
void* operator new(std::size_t n, std::align_val_t al, const std::nothrow_t&) noexcept {
  return new_nothrow_impl(n, static_cast<std::size_t>(al), MEMPROF_CALL_SITE());
}
void* operator new[](std::size_t n, std::align_val_t al, const std::nothrow_t&) noexcept {
  return new_nothrow_impl(n, static_cast<std::size_t>(al), MEMPROF_CALL_SITE());
}

void operator delete(void* p) noexcept { Dispatcher::deallocate(p); }
void operator delete[](void* p) noexcept { Dispatcher::deallocate(p); }
void operator delete(void* p, std::size_t) noexcept { Dispatcher::deallocate(p); }
void operator delete[](void* p, std::size_t) noexcept { Dispatcher::deallocate(p); }
void operator delete(void* p, const std::nothrow_t&) noexcept { Dispatcher::deallocate(p); }
void operator delete[](void* p, const std::nothrow_t&) noexcept { Dispatcher::deallocate(p); }
void operator delete(void* p, std::align_val_t) noexcept { Dispatcher::deallocate(p); }
void operator delete[](void* p, std::align_val_t) noexcept { Dispatcher::deallocate(p); }
void operator delete(void* p, std::size_t, std::align_val_t) noexcept { Dispatcher::deallocate(p); }
void operator delete[](void* p, std::size_t, std::align_val_t) noexcept { Dispatcher::deallocate(p); }
void operator delete(void* p, std::align_val_t, const std::nothrow_t&) noexcept { Dispatcher::deallocate(p); }
void operator delete[](void* p, std::align_val_t, const std::nothrow_t&) noexcept { Dispatcher::deallocate(p); }
