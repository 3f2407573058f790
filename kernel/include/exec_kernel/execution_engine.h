#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "cancellation.h"
#include "process.h"
#include "types.h"

namespace exec_kernel {

struct EngineOptions {
    // The code is appended as the last argument.
    std::vector<std::string> command{"python3", "-I", "-B", "-c"};
    size_t max_output_bytes = 1 << 20;
    std::chrono::milliseconds kill_grace{2000};
    bool apply_memory_limit = false;  // RLIMIT_AS from the request
    ProcessLimits limits;             // baseline rlimits for the child
    std::string working_dir = "/tmp";
};

/// Runs code as a plain child process with a wall-clock deadline.
///
/// There is no isolation boundary: use it for trusted input only. Results
/// follow the same error-kind contract as SandboxManager, with
/// `sandboxed` false.
class ExecutionEngine {
public:
    explicit ExecutionEngine(EngineOptions options = {});

    /// Never throws: every failure becomes a failed result.
    ExecutionResult run(const ExecutionRequest& request, const CancellationToken& cancel = {}) const;

    const EngineOptions& options() const { return options_; }

private:
    EngineOptions options_;
};

} // namespace exec_kernel
