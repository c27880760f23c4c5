/***
 * Name: tether::sync::FairMutex
 * Purpose: FIFO-fair mutex (ticket lock) for use under GcSafeMutex.
 * Theory of Operation:
 *   lock() draws a ticket and waits until it is served; unlock() serves the next ticket.
 *   try_lock() succeeds only when nobody is waiting, so it never jumps the queue.
 */
#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace tether::sync {

class FairMutex {
 public:
  FairMutex() = default;
  FairMutex(const FairMutex&) = delete;
  FairMutex& operator=(const FairMutex&) = delete;

  void lock();
  bool try_lock();
  void unlock();

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  uint64_t next_{0};
  uint64_t serving_{0};
};

} // namespace tether::sync
