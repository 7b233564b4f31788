/// @file executor.hpp
/// @brief The worker pool behind diff_each and apply_each.
///
/// Internal header, not installed.

#pragma once

#include <taskflow/taskflow.hpp>

namespace spatch::detail {

/// The process-global executor the batch entry points run on. Each task
/// diffs or applies one independent document pair and writes its own
/// Result slot, so tasks share nothing but read-only inputs.
///
/// Created on first use with one worker per hardware thread. The single
/// document operations never touch it.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace spatch::detail
