// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace memprof { namespace alloc {

inline constexpr const char* kConfigEnvVar = "MEMPROF_ALLOC_CONF";
inline constexpr std::size_t kMaxClassifierFrames = 64;
inline constexpr std::chrono::microseconds kMaxLockTimeout{10'000'000};

struct Config {
  bool        enabled{false};
  // Budget for any registry lock taken on the allocation path.
  std::chrono::microseconds lock_timeout{200};
  // Allocations of at most this many bytes are never tracked.
  std::size_t size_threshold{0};
  bool        classifier_fallback{true};
  std::size_t classifier_max_frames{32};
  // Case-sensitive substrings identifying instrumentation-internal frames.
  std::vector<std::string> internal_patterns{"memprof::"};
  bool        log_sealed_writes{true};
};

// Parse "key=value,key=value". Unknown keys and malformed values keep defaults.
Config parse_config(const char* conf);

// parse_config(getenv(MEMPROF_ALLOC_CONF)).
Config config_from_env();

}} // namespace memprof::alloc
