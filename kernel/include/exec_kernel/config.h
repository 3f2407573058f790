#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "types.h"

namespace exec_kernel {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct KernelConfig {
    // Interpreter argv. The sandbox appends the payload file name; the
    // direct engine appends "-c <code>".
    std::vector<std::string> interpreter{"python3", "-I", "-B"};
    std::string image = "python:3.11-slim";

    std::chrono::milliseconds default_timeout{std::chrono::seconds(30)};
    int64_t default_memory_mb = 128;
    double default_cpu_fraction = 0.5;
    bool default_isolated = true;

    size_t max_code_length = 100000;
    int max_concurrent_environments = 8;
    size_t max_output_bytes = 1 << 20;
    int64_t pids_max = 64;

    bool monitor = false;
    std::chrono::milliseconds monitor_interval{100};
    std::chrono::milliseconds runtime_call_timeout{2000};
    std::chrono::milliseconds kill_grace{2000};

    std::string cgroup_root;       // empty = /sys/fs/cgroup/exec_kernel when writable
    std::string work_root = "/tmp";
    std::string log_level = "info";

    /// Defaults for requests that do not override them.
    ExecutionRequest request_defaults() const;
};

/// Throws ConfigError when a field is outside its valid range.
void validate_config(const KernelConfig& config);

/// Read "key = value" lines ('#' starts a comment) on top of `base`.
/// Unknown keys and malformed values throw ConfigError.
KernelConfig load_config_file(const std::string& path, KernelConfig base = {});

/// Overlay EXEC_KERNEL_<KEY> environment variables, e.g. EXEC_KERNEL_DEFAULT_MEMORY_MB.
KernelConfig apply_env_overrides(KernelConfig config);

/// Set a single field by its file key.
void set_config_value(KernelConfig& config, const std::string& key, const std::string& value);

} // namespace exec_kernel
