/***
 * Name: tether::handle::CancellationToken
 * Purpose: Shared flag observed by async tasks at their checkpoints.
 * Theory of Operation:
 *   Copies share one atomic flag. Setting it never interrupts a task; the task reports
 *   Cancelled the next time it passes a checkpoint.
 */
#pragma once

#include <atomic>
#include <memory>

namespace tether::handle {

class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const noexcept { flag_->store(true, std::memory_order_release); }
  bool is_cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

  friend bool operator==(const CancellationToken& a, const CancellationToken& b) noexcept {
    return a.flag_ == b.flag_;
  }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace tether::handle
