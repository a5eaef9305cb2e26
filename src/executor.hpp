#pragma once

// Process-global Taskflow executor.
//
// Snapshot writes, compaction and their retries run here so that live
// editing never waits on storage.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace scenesync::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace scenesync::detail
