// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <optional>
#include <cassert>
#include <absl/log/check.h>
#include <absl/log/log.h>

namespace memprof {
// Initialize Abseil logging once; optionally set min log level.
void InitLogging(std::optional<int> min_level);

// Point the stack symbolizer at the running binary. Optional on Linux.
void InitSymbolizer(const char* argv0);
}

#define MEMPROF_LOG(level) LOG(level)
#define MEMPROF_CHECK(cond) CHECK(cond)
#define MEMPROF_ASSERT(cond) assert(cond)
