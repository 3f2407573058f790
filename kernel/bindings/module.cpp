#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "exec_kernel/code_execution_tool.h"
#include "exec_kernel/config.h"
#include "exec_kernel/logging.h"
#include "exec_kernel/syntax_validator.h"
#include "exec_kernel/types.h"

namespace py = pybind11;
using namespace exec_kernel;

PYBIND11_MODULE(exec_kernel, m) {
    m.doc() = "Sandboxed code execution: syntax validation, isolated runs with quotas, direct runs";

    // ── Results ─────────────────────────────────────────────────────────

    py::enum_<ErrorKind>(m, "ErrorKind")
        .value("NONE", ErrorKind::None)
        .value("SYNTAX_ERROR", ErrorKind::SyntaxError)
        .value("RUNTIME_ERROR", ErrorKind::RuntimeError)
        .value("TIMEOUT_ERROR", ErrorKind::TimeoutError)
        .value("RESOURCE_LIMIT_EXCEEDED", ErrorKind::ResourceLimitExceeded)
        .value("ISOLATION_FAILURE", ErrorKind::IsolationFailure)
        .value("INTERNAL_ERROR", ErrorKind::InternalError)
        .value("CANCELLED", ErrorKind::Cancelled)
        .value("REJECTED", ErrorKind::Rejected)
        .value("INVALID_REQUEST", ErrorKind::InvalidRequest)
        .def("__str__", [](ErrorKind k) { return std::string(to_string(k)); });

    py::class_<ResourceUsage>(m, "ResourceUsage")
        .def_readonly("peak_memory_mb", &ResourceUsage::peak_memory_mb)
        .def_readonly("avg_cpu_percent", &ResourceUsage::avg_cpu_percent)
        .def_readonly("samples", &ResourceUsage::samples);

    py::class_<ExecutionResult>(m, "ExecutionResult")
        .def_readonly("success", &ExecutionResult::success)
        .def_readonly("output", &ExecutionResult::output)
        .def_readonly("error_output", &ExecutionResult::error_output)
        .def_readonly("error_kind", &ExecutionResult::error_kind)
        .def_readonly("error_message", &ExecutionResult::error_message)
        .def_property_readonly("elapsed_ms", &ExecutionResult::elapsed_ms)
        .def_readonly("resource_usage", &ExecutionResult::resource_usage)
        .def_readonly("exit_code", &ExecutionResult::exit_code)
        .def_readonly("sandboxed", &ExecutionResult::sandboxed);

    py::class_<SyntaxCheck>(m, "SyntaxCheck")
        .def_readonly("valid", &SyntaxCheck::valid)
        .def_readonly("message", &SyntaxCheck::message)
        .def_readonly("line", &SyntaxCheck::line)
        .def_readonly("column", &SyntaxCheck::column)
        .def("describe", &SyntaxCheck::describe);

    // ── Configuration ───────────────────────────────────────────────────

    py::register_exception<ConfigError>(m, "ConfigError");

    py::class_<KernelConfig>(m, "KernelConfig")
        .def(py::init<>())
        .def_readwrite("interpreter", &KernelConfig::interpreter)
        .def_readwrite("image", &KernelConfig::image)
        .def_readwrite("default_timeout", &KernelConfig::default_timeout)
        .def_readwrite("default_memory_mb", &KernelConfig::default_memory_mb)
        .def_readwrite("default_cpu_fraction", &KernelConfig::default_cpu_fraction)
        .def_readwrite("default_isolated", &KernelConfig::default_isolated)
        .def_readwrite("max_code_length", &KernelConfig::max_code_length)
        .def_readwrite("max_concurrent_environments", &KernelConfig::max_concurrent_environments)
        .def_readwrite("max_output_bytes", &KernelConfig::max_output_bytes)
        .def_readwrite("monitor", &KernelConfig::monitor)
        .def_readwrite("monitor_interval", &KernelConfig::monitor_interval)
        .def_readwrite("cgroup_root", &KernelConfig::cgroup_root)
        .def_readwrite("work_root", &KernelConfig::work_root)
        .def_readwrite("log_level", &KernelConfig::log_level);

    m.def("load_config_file", &load_config_file, py::arg("path"), py::arg("base") = KernelConfig{});
    m.def("apply_env_overrides", &apply_env_overrides, py::arg("config"));
    m.def("set_log_level", &set_log_level, py::arg("level"));

    // ── Tool ────────────────────────────────────────────────────────────

    py::class_<CancellationToken>(m, "CancellationToken")
        .def(py::init<>())
        .def("cancel", &CancellationToken::cancel)
        .def_property_readonly("cancelled", &CancellationToken::cancelled);

    py::class_<LimitsUpdate>(m, "LimitsUpdate")
        .def_readonly("memory_limit_mb", &LimitsUpdate::memory_limit_mb)
        .def_readonly("cpu_fraction", &LimitsUpdate::cpu_fraction)
        .def_readonly("live_environments_updated", &LimitsUpdate::live_environments_updated);

    py::class_<ExecutionStats>(m, "ExecutionStats")
        .def_readonly("total", &ExecutionStats::total)
        .def_readonly("succeeded", &ExecutionStats::succeeded)
        .def_readonly("syntax_errors", &ExecutionStats::syntax_errors)
        .def_readonly("runtime_errors", &ExecutionStats::runtime_errors)
        .def_readonly("timeouts", &ExecutionStats::timeouts)
        .def_readonly("resource_exceeded", &ExecutionStats::resource_exceeded)
        .def_readonly("infrastructure_faults", &ExecutionStats::infrastructure_faults)
        .def_readonly("rejected", &ExecutionStats::rejected)
        .def_readonly("cancelled", &ExecutionStats::cancelled)
        .def_readonly("invalid", &ExecutionStats::invalid)
        .def_readonly("teardown_failures", &ExecutionStats::teardown_failures);

    py::class_<CodeExecutionTool>(m, "CodeExecutionTool")
        .def(py::init(&CodeExecutionTool::create), py::arg("config") = KernelConfig{})
        .def("execute",
             [](CodeExecutionTool& tool, const std::string& code, std::optional<bool> sandbox,
                std::optional<int> timeout, std::optional<int64_t> memory_mb,
                std::optional<double> cpu, const CancellationToken& cancel) {
                 RequestOptions options;
                 options.code = code;
                 options.isolated = sandbox;
                 options.timeout_seconds = timeout;
                 options.memory_limit_mb = memory_mb;
                 options.cpu_fraction = cpu;
                 py::gil_scoped_release release;
                 return tool.execute(options, cancel);
             },
             py::arg("code"), py::arg("sandbox") = py::none(), py::arg("timeout") = py::none(),
             py::arg("memory_limit_mb") = py::none(), py::arg("cpu_limit") = py::none(),
             py::arg("cancel") = CancellationToken{})
        .def("execute_with_monitoring",
             [](CodeExecutionTool& tool, const std::string& code, std::optional<bool> sandbox,
                std::optional<int> timeout) {
                 RequestOptions options;
                 options.code = code;
                 options.isolated = sandbox;
                 options.timeout_seconds = timeout;
                 py::gil_scoped_release release;
                 return tool.execute_with_monitoring(options);
             },
             py::arg("code"), py::arg("sandbox") = py::none(), py::arg("timeout") = py::none())
        .def("validate_syntax", &CodeExecutionTool::validate_syntax, py::arg("code"))
        .def("update_limits", &CodeExecutionTool::update_limits,
             py::arg("memory_mb") = py::none(), py::arg("cpu_limit") = py::none(),
             py::call_guard<py::gil_scoped_release>())
        .def("stats", &CodeExecutionTool::stats)
        .def("reset_stats", &CodeExecutionTool::reset_stats);
}
