#include "exec_kernel/isolation_runtime.h"

namespace exec_kernel {

SerializedRuntime::SerializedRuntime(std::shared_ptr<IsolationRuntime> inner)
    : inner_(std::move(inner)) {
    if (!inner_) throw std::invalid_argument("SerializedRuntime requires a runtime");
}

EnvironmentHandle SerializedRuntime::create_environment(const EnvironmentSpec& spec) {
    std::lock_guard<std::mutex> lock(mtx_);
    return inner_->create_environment(spec);
}

void SerializedRuntime::start(const EnvironmentHandle& handle, const std::string& code) {
    std::lock_guard<std::mutex> lock(mtx_);
    inner_->start(handle, code);
}

WaitResult SerializedRuntime::wait(const EnvironmentHandle& handle,
                                   std::chrono::steady_clock::time_point deadline) {
    // Not serialised: holding the lock here would block kill() for the whole run.
    return inner_->wait(handle, deadline);
}

void SerializedRuntime::kill(const EnvironmentHandle& handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    inner_->kill(handle);
}

void SerializedRuntime::remove(const EnvironmentHandle& handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    inner_->remove(handle);
}

ResourceSnapshot SerializedRuntime::stats(const EnvironmentHandle& handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    return inner_->stats(handle);
}

void SerializedRuntime::update(const EnvironmentHandle& handle, const ResourceConstraints& constraints) {
    std::lock_guard<std::mutex> lock(mtx_);
    inner_->update(handle, constraints);
}

} // namespace exec_kernel
