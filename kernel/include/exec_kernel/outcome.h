#pragma once

#include <chrono>
#include <string>

#include "isolation_runtime.h"
#include "types.h"

namespace exec_kernel {

/// Map an observed exit onto the result contract shared by both engines:
/// clean exit -> success, OOM or quota kill -> ResourceLimitExceeded,
/// anything else -> RuntimeError. Output and exit code are carried over.
ExecutionResult result_from_exit(const WaitResult& wait, std::chrono::milliseconds elapsed);

/// True when the interpreter died of an allocation it could not satisfy:
/// exit status 1 and a traceback whose final line is a bare "MemoryError".
/// Used where the memory ceiling is an rlimit and no kernel counter exists.
/// A MemoryError carrying a message, or text merely printed to stderr, does
/// not qualify.
bool is_allocation_failure(const ExitStatus& status, const std::string& stderr_output);

ExecutionResult timeout_result(std::chrono::milliseconds timeout, std::chrono::milliseconds elapsed);
ExecutionResult cancelled_result(std::chrono::milliseconds elapsed);

} // namespace exec_kernel
