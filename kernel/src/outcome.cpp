#include "exec_kernel/outcome.h"

#include <string.h>

#include <cstdio>

namespace exec_kernel {

namespace {

std::string seconds_text(std::chrono::milliseconds d) {
    char buf[32];
    if (d.count() % 1000 == 0) {
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d.count() / 1000));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(d.count()) / 1000.0);
    }
    return buf;
}

} // anonymous namespace

bool is_allocation_failure(const ExitStatus& status, const std::string& stderr_output) {
    if (status.term_signal != 0 || status.exit_code != 1) return false;

    const size_t end = stderr_output.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return false;
    const size_t nl = stderr_output.rfind('\n', end);
    const size_t begin = nl == std::string::npos ? 0 : nl + 1;
    if (stderr_output.compare(begin, end + 1 - begin, "MemoryError") != 0) return false;

    // The report must be the interpreter's own, with a traceback above it.
    return stderr_output.rfind("Traceback (most recent call last):\n", begin) != std::string::npos;
}

ExecutionResult result_from_exit(const WaitResult& wait, std::chrono::milliseconds elapsed) {
    const ExitStatus& st = wait.status;
    ExecutionResult r;

    if (st.oom_killed) {
        r = ExecutionResult::failed(ErrorKind::ResourceLimitExceeded,
                                    "Memory limit exceeded: environment was killed by the out-of-memory handler",
                                    elapsed);
    } else if (st.quota_killed) {
        std::string what = st.term_signal ? strsignal(st.term_signal) : "quota";
        r = ExecutionResult::failed(ErrorKind::ResourceLimitExceeded,
                                    "Resource quota exceeded: " + what, elapsed);
    } else if (st.term_signal == 0 && st.exit_code == 0) {
        r = ExecutionResult::succeeded(wait.stdout_output, elapsed);
    } else {
        std::string msg = wait.stderr_output;
        if (msg.empty()) {
            msg = st.term_signal
                ? "Process killed by signal " + std::to_string(st.term_signal) + " (" + strsignal(st.term_signal) + ")"
                : "Process exited with status " + std::to_string(st.exit_code);
        }
        r = ExecutionResult::failed(ErrorKind::RuntimeError, std::move(msg), elapsed);
    }

    r.output = wait.stdout_output;
    r.error_output = wait.stderr_output;
    if (st.term_signal == 0) r.exit_code = st.exit_code;
    return r;
}

ExecutionResult timeout_result(std::chrono::milliseconds timeout, std::chrono::milliseconds elapsed) {
    return ExecutionResult::failed(ErrorKind::TimeoutError,
                                   "Execution timed out after " + seconds_text(timeout) + " seconds",
                                   elapsed);
}

ExecutionResult cancelled_result(std::chrono::milliseconds elapsed) {
    return ExecutionResult::failed(ErrorKind::Cancelled, "Execution cancelled by caller", elapsed);
}

} // namespace exec_kernel
