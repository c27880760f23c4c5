/***
 * Name: tether::sync GC-safe primitives
 * Purpose: Locks and a once-cell that let a collection proceed while the caller is blocked.
 * Inputs: An underlying lock type M (std::mutex, std::shared_mutex, FairMutex, ...)
 * Outputs: Lockable wrappers usable with std::lock_guard / std::unique_lock / std::shared_lock
 * Theory of Operation:
 *   Each acquisition first tries the non-blocking path. If that fails the thread enters the
 *   GC-safe state, blocks on M, and leaves the GC-safe state once it holds the lock (waiting
 *   for a collection in progress to finish). Fairness is M's.
 *
 *   Precondition: GcSafeMutex, GcSafeRwLock and GcSafeOnceLock must only be used from adopted
 *   mutator threads. Using them from any other thread is undefined behavior.
 *
 *   GcSafeRegion alone is meant for waits that may happen on any thread (channel and oneshot
 *   receives, joins); on a thread that is not adopted it does nothing.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>

namespace tether::sync {

// The calling thread is GC-safe for the lifetime of the region.
class GcSafeRegion {
 public:
  GcSafeRegion() noexcept;
  ~GcSafeRegion();
  GcSafeRegion(const GcSafeRegion&) = delete;
  GcSafeRegion& operator=(const GcSafeRegion&) = delete;

 private:
  int8_t previous_;
};

template <typename M = std::mutex>
class GcSafeMutex {
 public:
  void lock() {
    if (mutex_.try_lock()) { return; }
    const GcSafeRegion safe;
    mutex_.lock();
  }
  bool try_lock() { return mutex_.try_lock(); }
  void unlock() { mutex_.unlock(); }

  M& native() noexcept { return mutex_; }

 private:
  M mutex_;
};

template <typename M = std::shared_mutex>
class GcSafeRwLock {
 public:
  void lock() {
    if (mutex_.try_lock()) { return; }
    const GcSafeRegion safe;
    mutex_.lock();
  }
  bool try_lock() { return mutex_.try_lock(); }
  void unlock() { mutex_.unlock(); }

  void lock_shared() {
    if (mutex_.try_lock_shared()) { return; }
    const GcSafeRegion safe;
    mutex_.lock_shared();
  }
  bool try_lock_shared() { return mutex_.try_lock_shared(); }
  void unlock_shared() { mutex_.unlock_shared(); }

 private:
  M mutex_;
};

// Initialized at most once; an initializer that throws leaves the cell empty.
template <typename T, typename M = std::mutex>
class GcSafeOnceLock {
 public:
  T* get() noexcept { return ready_.load(std::memory_order_acquire) ? &*value_ : nullptr; }
  bool is_initialized() const noexcept { return ready_.load(std::memory_order_acquire); }

  template <typename F>
  T& get_or_init(F&& init) {
    if (ready_.load(std::memory_order_acquire)) { return *value_; }
    const std::lock_guard<GcSafeMutex<M>> lock(mutex_);
    if (!ready_.load(std::memory_order_relaxed)) {
      value_.emplace(std::invoke(std::forward<F>(init)));
      ready_.store(true, std::memory_order_release);
    }
    return *value_;
  }

 private:
  GcSafeMutex<M> mutex_;
  std::atomic<bool> ready_{false};
  std::optional<T> value_;
};

} // namespace tether::sync
