#pragma once

#include <atomic>
#include <memory>

namespace exec_kernel {

/// Shared cancellation flag. Copies observe the same state, so the caller
/// keeps one copy and hands another to execute().
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }
    bool cancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace exec_kernel
