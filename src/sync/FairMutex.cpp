/***
 * Name: tether::sync::FairMutex
 * Purpose: Ticket lock implementation.
 */
#include "tether/sync/FairMutex.h"

namespace tether::sync {

void FairMutex::lock() {
  std::unique_lock<std::mutex> lk(mu_);
  const uint64_t ticket = next_++;
  cv_.wait(lk, [this, ticket] { return serving_ == ticket; });
}

bool FairMutex::try_lock() {
  const std::lock_guard<std::mutex> lk(mu_);
  if (serving_ != next_) { return false; }
  ++next_;
  return true;
}

void FairMutex::unlock() {
  {
    const std::lock_guard<std::mutex> lk(mu_);
    ++serving_;
  }
  cv_.notify_all();
}

} // namespace tether::sync
