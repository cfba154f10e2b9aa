// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <cstdint>

namespace memprof { namespace alloc {

// Internal bumpers used by the dispatcher, arena and classifier. Not part of public API.
void _stats_tracked_allocation() noexcept;
void _stats_passthrough_allocation() noexcept;
void _stats_tracked_free() noexcept;
void _stats_passthrough_free() noexcept;
void _stats_demoted_allocation() noexcept;
void _stats_reentrant_fallback() noexcept;
void _stats_torn_down_fallback() noexcept;
void _stats_state_access_failure() noexcept;
void _stats_arena_exhausted() noexcept;
void _stats_classifier_invoked() noexcept;
void _stats_classifier_cache_hit() noexcept;
void _stats_classification_uncertain() noexcept;
void _stats_scope_order_violation() noexcept;
void _stats_task_stack_overflow() noexcept;

}} // namespace memprof::alloc
