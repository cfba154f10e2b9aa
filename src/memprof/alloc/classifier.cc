// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "memprof/alloc/classifier.h"

#include <algorithm>
#include <atomic>
#include <string_view>
#include <utility>

#include "memprof/alloc/config.h"
#include "memprof/alloc/scope_guard.h"
#include "memprof/alloc/stack_inspector.h"
#include "memprof/alloc/thread_state.h"
#include "memprof/alloc/detail/stats_internal.h"

namespace memprof { namespace alloc {

namespace {

std::atomic<std::uint64_t> g_next_generation{1};

// Innermost frames belonging to the allocation hook; skipped before matching
// so the hook never classifies itself as instrumentation.
constexpr std::string_view kHookFrames[] = {
    "memprof::alloc::Dispatcher",
    "memprof::alloc::CallSiteClassifier",
    "memprof::alloc::StackInspector",
    "memprof::alloc::(anonymous namespace)",
    "operator new",
    "operator delete",
    "malloc",
    "realloc",
};

bool is_hook_frame(std::string_view sym) noexcept {
  for (std::string_view h : kHookFrames) {
    if (sym.find(h) != std::string_view::npos) return true;
  }
  return false;
}

} // namespace

CallSiteClassifier::CallSiteClassifier(Options opts, StackInspector* inspector)
    : opts_(std::move(opts)),
      inspector_(inspector ? inspector : &default_stack_inspector()),
      generation_(g_next_generation.fetch_add(1, std::memory_order_relaxed)) {
  opts_.max_frames = std::clamp<std::size_t>(opts_.max_frames, 1, kMaxClassifierFrames);
  auto& pats = opts_.internal_patterns;
  pats.erase(std::remove_if(pats.begin(), pats.end(), [](const std::string& p) { return p.empty(); }), pats.end());
}

AllocatorKind CallSiteClassifier::classify(const ThreadAllocatorState& st) noexcept {
  if (st.override_depth > 0) return st.current_kind;
  if (!opts_.fallback_enabled || opts_.internal_patterns.empty()) return AllocatorKind::TaskTracked;
  return classify_stack();
}

AllocatorKind CallSiteClassifier::classify_stack() noexcept {
  // Unwinder and symbolizer may allocate on first use.
  ScopeGuard pass(AllocatorKind::Passthrough);
  _stats_classifier_invoked();

  void* pcs[kMaxClassifierFrames];
  const int n = inspector_->capture(pcs, static_cast<int>(opts_.max_frames), 1);
  if (n <= 0) {
    _stats_classification_uncertain();
    return AllocatorKind::TaskTracked;
  }

  char sym[1024];
  bool resolved_any = false;
  bool past_hook = false;
  for (int i = 0; i < n; ++i) {
    if (!inspector_->symbolize(pcs[i], sym, static_cast<int>(sizeof(sym)))) continue;
    resolved_any = true;
    const std::string_view s(sym);
    if (!past_hook) {
      if (is_hook_frame(s)) continue;
      past_hook = true;
    }
    for (const std::string& p : opts_.internal_patterns) {
      if (s.find(p) != std::string_view::npos) return AllocatorKind::Passthrough;
    }
  }
  if (!resolved_any) {
    _stats_classification_uncertain();
  }
  return AllocatorKind::TaskTracked;
}

}} // namespace memprof::alloc
