#include "exec_kernel/config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace exec_kernel {

namespace {

const char* const kKeys[] = {
    "interpreter", "image",
    "default_timeout_seconds", "default_memory_mb", "default_cpu_fraction", "default_isolated",
    "max_code_length", "max_concurrent_environments", "max_output_bytes", "pids_max",
    "monitor", "monitor_interval_ms", "runtime_call_timeout_ms", "kill_grace_ms",
    "cgroup_root", "work_root", "log_level",
};

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

int64_t parse_int(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        int64_t v = std::stoll(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("invalid integer for " + key + ": '" + value + "'");
    }
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError("invalid number for " + key + ": '" + value + "'");
    }
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError("invalid boolean for " + key + ": '" + value + "'");
}

std::vector<std::string> split_words(const std::string& value) {
    std::vector<std::string> words;
    std::istringstream iss(value);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

} // anonymous namespace

ExecutionRequest KernelConfig::request_defaults() const {
    ExecutionRequest req;
    req.timeout = default_timeout;
    req.memory_limit_mb = default_memory_mb;
    req.cpu_fraction = default_cpu_fraction;
    req.isolated = default_isolated;
    return req;
}

void validate_config(const KernelConfig& c) {
    if (c.interpreter.empty()) throw ConfigError("interpreter must not be empty");
    auto timeout_s = std::chrono::duration_cast<std::chrono::seconds>(c.default_timeout).count();
    if (c.default_timeout.count() <= 0 || timeout_s > kMaxTimeoutSeconds) {
        throw ConfigError("default_timeout_seconds must be between 1 and 300");
    }
    if (c.default_memory_mb < kMinMemoryLimitMb || c.default_memory_mb > kMaxMemoryLimitMb) {
        throw ConfigError("default_memory_mb must be between 1 and 4096");
    }
    if (std::isnan(c.default_cpu_fraction) || c.default_cpu_fraction <= 0.0 || c.default_cpu_fraction > 1.0) {
        throw ConfigError("default_cpu_fraction must be in (0, 1]");
    }
    if (c.max_code_length == 0) throw ConfigError("max_code_length must be positive");
    if (c.max_concurrent_environments < 1) throw ConfigError("max_concurrent_environments must be at least 1");
    if (c.max_output_bytes == 0) throw ConfigError("max_output_bytes must be positive");
    if (c.pids_max == 0 || c.pids_max < -1) throw ConfigError("pids_max must be positive or -1");
    if (c.monitor_interval.count() <= 0) throw ConfigError("monitor_interval_ms must be positive");
    if (c.runtime_call_timeout.count() <= 0) throw ConfigError("runtime_call_timeout_ms must be positive");
    if (c.kill_grace.count() <= 0) throw ConfigError("kill_grace_ms must be positive");
    if (c.work_root.empty()) throw ConfigError("work_root must not be empty");

    static const char* const levels[] = {
        "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off",
    };
    if (std::find(std::begin(levels), std::end(levels), c.log_level) == std::end(levels)) {
        throw ConfigError("unknown log_level: " + c.log_level);
    }
}

void set_config_value(KernelConfig& c, const std::string& key, const std::string& raw) {
    const std::string value = trim(raw);

    if (key == "interpreter") {
        c.interpreter = split_words(value);
    } else if (key == "image") {
        c.image = value;
    } else if (key == "default_timeout_seconds") {
        c.default_timeout = std::chrono::seconds(parse_int(key, value));
    } else if (key == "default_memory_mb") {
        c.default_memory_mb = parse_int(key, value);
    } else if (key == "default_cpu_fraction") {
        c.default_cpu_fraction = parse_double(key, value);
    } else if (key == "default_isolated") {
        c.default_isolated = parse_bool(key, value);
    } else if (key == "max_code_length") {
        c.max_code_length = static_cast<size_t>(std::max<int64_t>(0, parse_int(key, value)));
    } else if (key == "max_concurrent_environments") {
        c.max_concurrent_environments = static_cast<int>(parse_int(key, value));
    } else if (key == "max_output_bytes") {
        c.max_output_bytes = static_cast<size_t>(std::max<int64_t>(0, parse_int(key, value)));
    } else if (key == "pids_max") {
        c.pids_max = parse_int(key, value);
    } else if (key == "monitor") {
        c.monitor = parse_bool(key, value);
    } else if (key == "monitor_interval_ms") {
        c.monitor_interval = std::chrono::milliseconds(parse_int(key, value));
    } else if (key == "runtime_call_timeout_ms") {
        c.runtime_call_timeout = std::chrono::milliseconds(parse_int(key, value));
    } else if (key == "kill_grace_ms") {
        c.kill_grace = std::chrono::milliseconds(parse_int(key, value));
    } else if (key == "cgroup_root") {
        c.cgroup_root = value;
    } else if (key == "work_root") {
        c.work_root = value;
    } else if (key == "log_level") {
        c.log_level = value;
    } else {
        throw ConfigError("unknown config key: " + key);
    }
}

KernelConfig load_config_file(const std::string& path, KernelConfig base) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("cannot open config file: " + path);

    std::string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError(path + ":" + std::to_string(line_no) + ": expected key = value");
        }
        std::string key = trim(line.substr(0, eq));
        try {
            set_config_value(base, key, line.substr(eq + 1));
        } catch (const ConfigError& e) {
            throw ConfigError(path + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }

    validate_config(base);
    return base;
}

KernelConfig apply_env_overrides(KernelConfig config) {
    for (const char* key : kKeys) {
        std::string name = "EXEC_KERNEL_";
        for (const char* p = key; *p; ++p) {
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(*p)));
        }
        if (const char* value = std::getenv(name.c_str())) {
            set_config_value(config, key, value);
        }
    }
    validate_config(config);
    return config;
}

} // namespace exec_kernel
