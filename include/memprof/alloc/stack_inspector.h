// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace memprof { namespace alloc {

// Best-effort view of the calling thread's stack. Implementations must not
// throw; they may allocate (callers run them under a Passthrough scope).
class StackInspector {
 public:
  virtual ~StackInspector() = default;

  // Fills pcs[0..n) innermost first, skipping `skip` frames of the caller.
  // Returns n, or 0 when the stack cannot be captured.
  virtual int capture(void** pcs, int max_frames, int skip) noexcept = 0;

  // Writes the demangled symbol for `pc` into out[0..out_len), NUL-terminated.
  virtual bool symbolize(const void* pc, char* out, int out_len) noexcept = 0;
};

// Abseil-backed inspector (absl::GetStackTrace + absl::Symbolize). Both are
// async-signal-safe and do not allocate on Linux.
StackInspector& default_stack_inspector() noexcept;

}} // namespace memprof::alloc
