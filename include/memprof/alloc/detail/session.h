// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "memprof/alloc/classifier.h"
#include "memprof/alloc/config.h"
#include "memprof/alloc/task_registry.h"

namespace memprof { namespace alloc {

class StackInspector;

namespace detail {

// Everything owned by one enable()..disable() interval.
struct Session {
  Session(const Config& cfg, StackInspector* inspector);

  const Config config;
  TaskStatsRegistry registry;
  CallSiteClassifier classifier;
};

// Keeps the current session alive for the pin's scope. disable() waits for
// all pins to drop before destroying the session. Pins must stay short; they
// are taken on the allocation path.
class SessionPin final {
 public:
  SessionPin() noexcept;
  ~SessionPin() noexcept;
  SessionPin(const SessionPin&) = delete;
  SessionPin& operator=(const SessionPin&) = delete;

  Session* get() const noexcept { return s_; }
  Session* operator->() const noexcept { return s_; }
  explicit operator bool() const noexcept { return s_ != nullptr; }

 private:
  Session* s_{nullptr};
};

// The process-wide switch: a single relaxed load.
bool enabled_fast() noexcept;

} // namespace detail
}} // namespace memprof::alloc
