#pragma once
#include <atomic>
#include <memory>

namespace plug_scan {

// Shared cooperative cancellation flag; copies observe the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    // Returns true only for the call that flipped the flag.
    bool request() { bool expected = false; return flag_->compare_exchange_strong(expected, true); }
    bool cancelled() const { return flag_->load(std::memory_order_acquire); }
private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}
