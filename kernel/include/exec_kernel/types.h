#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace exec_kernel {

enum class ErrorKind {
    None,
    SyntaxError,
    RuntimeError,
    TimeoutError,
    ResourceLimitExceeded,
    IsolationFailure,
    InternalError,
    Cancelled,
    Rejected,        // concurrency ceiling reached
    InvalidRequest,  // refused before parsing (e.g. oversized code)
};

const char* to_string(ErrorKind kind) noexcept;

/// True for kinds caused by the host or the isolation runtime rather than the code.
bool is_infrastructure_fault(ErrorKind kind) noexcept;

struct ExecutionRequest {
    std::string code;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    int64_t memory_limit_mb = 128;
    double cpu_fraction = 0.5;
    bool isolated = true;
};

/// Throws std::invalid_argument unless timeout > 0, memory > 0 and 0 < cpu <= 1.
void validate_request(const ExecutionRequest& request);

/// Caller-facing overrides. Unset fields fall back to configured defaults.
struct RequestOptions {
    std::string code;
    std::optional<int> timeout_seconds;      // 1..300
    std::optional<int64_t> memory_limit_mb;  // 1..4096
    std::optional<double> cpu_fraction;      // (0, 1]
    std::optional<bool> isolated;
};

constexpr int kMinTimeoutSeconds = 1;
constexpr int kMaxTimeoutSeconds = 300;
constexpr int64_t kMinMemoryLimitMb = 1;
constexpr int64_t kMaxMemoryLimitMb = 4096;

/// Build a request from caller overrides on top of `defaults`.
/// Out-of-range overrides throw std::invalid_argument.
ExecutionRequest make_request(const RequestOptions& options, const ExecutionRequest& defaults);

struct ResourceSnapshot {
    double cpu_percent = 0.0;
    double memory_mb = 0.0;
    double memory_percent = 0.0;
    // Limits in force when the sample was taken.
    int64_t memory_limit_mb = 0;
    double cpu_fraction = 0.0;
};

struct ResourceUsage {
    double peak_memory_mb = 0.0;
    double avg_cpu_percent = 0.0;
    int samples = 0;
};

class ExecutionResult {
public:
    static ExecutionResult succeeded(std::string output, std::chrono::milliseconds elapsed);
    static ExecutionResult failed(ErrorKind kind, std::string message, std::chrono::milliseconds elapsed);

    bool success = false;
    std::string output;
    std::string error_output;  // captured stderr
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::chrono::milliseconds elapsed{0};
    std::optional<ResourceUsage> resource_usage;
    std::optional<int> exit_code;
    bool sandboxed = false;

    int64_t elapsed_ms() const { return elapsed.count(); }
};

} // namespace exec_kernel
