#include "exec_kernel/types.h"

#include <cmath>
#include <stdexcept>

namespace exec_kernel {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None:                  return "None";
        case ErrorKind::SyntaxError:           return "SyntaxError";
        case ErrorKind::RuntimeError:          return "RuntimeError";
        case ErrorKind::TimeoutError:          return "TimeoutError";
        case ErrorKind::ResourceLimitExceeded: return "ResourceLimitExceeded";
        case ErrorKind::IsolationFailure:      return "IsolationFailureError";
        case ErrorKind::InternalError:         return "InternalError";
        case ErrorKind::Cancelled:             return "Cancelled";
        case ErrorKind::Rejected:              return "Rejected";
        case ErrorKind::InvalidRequest:        return "InvalidRequest";
    }
    return "Unknown";
}

bool is_infrastructure_fault(ErrorKind kind) noexcept {
    return kind == ErrorKind::IsolationFailure || kind == ErrorKind::InternalError;
}

void validate_request(const ExecutionRequest& request) {
    if (request.timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }
    if (request.memory_limit_mb <= 0) {
        throw std::invalid_argument("memory limit must be positive");
    }
    // Also rejects NaN.
    if (!(request.cpu_fraction > 0.0 && request.cpu_fraction <= 1.0)) {
        throw std::invalid_argument("cpu fraction must be in (0, 1]");
    }
}

ExecutionRequest make_request(const RequestOptions& options, const ExecutionRequest& defaults) {
    ExecutionRequest req = defaults;
    req.code = options.code;

    if (options.timeout_seconds) {
        int t = *options.timeout_seconds;
        if (t < kMinTimeoutSeconds || t > kMaxTimeoutSeconds) {
            throw std::invalid_argument("timeout_seconds must be between 1 and 300, got " + std::to_string(t));
        }
        req.timeout = std::chrono::seconds(t);
    }
    if (options.memory_limit_mb) {
        int64_t m = *options.memory_limit_mb;
        if (m < kMinMemoryLimitMb || m > kMaxMemoryLimitMb) {
            throw std::invalid_argument("memory_limit_mb must be between 1 and 4096, got " + std::to_string(m));
        }
        req.memory_limit_mb = m;
    }
    if (options.cpu_fraction) {
        double c = *options.cpu_fraction;
        if (std::isnan(c) || c <= 0.0 || c > 1.0) {
            throw std::invalid_argument("cpu_fraction must be in (0, 1]");
        }
        req.cpu_fraction = c;
    }
    if (options.isolated) req.isolated = *options.isolated;

    validate_request(req);
    return req;
}

ExecutionResult ExecutionResult::succeeded(std::string output, std::chrono::milliseconds elapsed) {
    ExecutionResult r;
    r.success = true;
    r.output = std::move(output);
    r.error_kind = ErrorKind::None;
    r.elapsed = elapsed;
    r.exit_code = 0;
    return r;
}

ExecutionResult ExecutionResult::failed(ErrorKind kind, std::string message, std::chrono::milliseconds elapsed) {
    if (kind == ErrorKind::None) {
        throw std::logic_error("failed result requires an error kind");
    }
    ExecutionResult r;
    r.success = false;
    r.error_kind = kind;
    r.error_message = message.empty() ? std::string(to_string(kind)) : std::move(message);
    r.elapsed = elapsed;
    return r;
}

} // namespace exec_kernel
