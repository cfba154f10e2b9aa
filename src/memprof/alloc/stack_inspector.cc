// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "memprof/alloc/stack_inspector.h"

#include <absl/debugging/stacktrace.h>
#include <absl/debugging/symbolize.h>

namespace memprof { namespace alloc {

namespace {

class AbslStackInspector final : public StackInspector {
 public:
  int capture(void** pcs, int max_frames, int skip) noexcept override {
    if (!pcs || max_frames <= 0) return 0;
    // +1 for this frame.
    return absl::GetStackTrace(pcs, max_frames, skip + 1);
  }

  bool symbolize(const void* pc, char* out, int out_len) noexcept override {
    if (!out || out_len <= 0) return false;
    return absl::Symbolize(pc, out, out_len);
  }
};

// Never destroyed: threads may still allocate while static destructors run.
union InspectorStorage {
  constexpr InspectorStorage() : inspector() {}
  ~InspectorStorage() {}
  AbslStackInspector inspector;
};

constinit InspectorStorage g_storage{};

} // namespace

StackInspector& default_stack_inspector() noexcept {
  return g_storage.inspector;
}

}} // namespace memprof::alloc
