// =============================================================================
// SnapADB - Local Process Runner
// =============================================================================
// Launches a local binary (the adb CLI, for start-server) with posix_spawn,
// waits for it, and reports how it ended. stdout is discarded; stderr is
// captured for error reporting.
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include "result.hpp"

namespace snapadb {

struct ProcessResult {
    int exit_code = -1;        // valid when term_signal == 0
    int term_signal = 0;       // signal that killed the process, 0 if it exited
    std::string stderr_text;

    bool succeeded() const { return term_signal == 0 && exit_code == 0; }
};

// argv[0] is `path`; `args` follow. Missing binary -> AdbNotFound.
AdbResult<ProcessResult> runProcess(const std::string& path, const std::vector<std::string>& args);

} // namespace snapadb
