#pragma once

// Global work-stealing executor via Taskflow.
//
// Provides a process-global tf::Executor singleton sized to
// std::thread::hardware_concurrency(). All internal parallelism
// (concurrent diffing during merges) submits work through this executor.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace canvas_merge::detail {

// Process-global executor. Created on first use, destroyed at exit.
// Taskflow's executor uses a work-stealing scheduler internally.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace canvas_merge::detail
