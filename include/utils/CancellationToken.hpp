#pragma once
#include <atomic>
#include <memory>

namespace autopatch {

// Shared flag a caller flips to abandon a run; copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}
