#pragma once

#include <atomic>
#include <memory>

namespace skycache::util {

/*
  Cooperative cancellation.

  A CancellationSource is owned by the running task; callers observe it
  through CancellationToken copies. Cancelling is sticky.
*/

class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancelled() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

 private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {
  }

  std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
 public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {
  }

  CancellationToken Token() const {
    return CancellationToken(flag_);
  }

  void Cancel() {
    flag_->store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return flag_->load(std::memory_order_acquire);
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace skycache::util
