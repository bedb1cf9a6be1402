#pragma once
#include <atomic>
#include <memory>

namespace tblift {

// Shared stop flag. Copies observe the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true, std::memory_order_release); }
    bool cancelled() const { return flag_->load(std::memory_order_acquire); }

    // raw flag for async-signal handlers (atomic<bool> is lock-free on Linux)
    std::atomic<bool>* raw() const { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace tblift
