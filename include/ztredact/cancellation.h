#pragma once

#include <atomic>
#include <memory>

namespace ztredact {

// Copies share one flag, so the caller keeps a copy and cancels while the
// pipeline checks its own.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace ztredact
