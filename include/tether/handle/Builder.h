/***
 * Name: tether::handle::Builder
 * Purpose: Entry point for starting the runtime under a local, async or pool handle.
 * Inputs: Fluent option setters
 * Outputs: A started handle
 * Theory of Operation:
 *   Each start() validates its options (ConfigError) and initializes the runtime. Only one
 *   handle may own the runtime per process; starting another while it runs, or after it has
 *   shut down, throws InvalidHandleState.
 */
#pragma once

#include <cstddef>
#include <string>
#include <utility>

#include "tether/handle/Config.h"

namespace tether::handle {

class LocalHandle;
class AsyncHandle;
class Pool;

class LocalBuilder {
 public:
  LocalBuilder& page_slots(std::size_t n) {
    config_.pageSlots = n;
    return *this;
  }
  const LocalConfig& config() const noexcept { return config_; }
  LocalHandle start() const;

 private:
  LocalConfig config_{};
};

class AsyncBuilder {
 public:
  AsyncBuilder& n_workers(std::size_t n) {
    config_.nWorkers = n;
    return *this;
  }
  AsyncBuilder& channel_capacity(std::size_t n) {
    config_.channelCapacity = n;
    return *this;
  }
  AsyncBuilder& max_concurrent_tasks(std::size_t n) {
    config_.maxConcurrentTasks = n;
    return *this;
  }
  AsyncBuilder& thread_prefix(std::string prefix) {
    config_.threadPrefix = std::move(prefix);
    return *this;
  }
  AsyncBuilder& page_slots(std::size_t n) {
    config_.pageSlots = n;
    return *this;
  }
  const AsyncConfig& config() const noexcept { return config_; }
  AsyncHandle start() const;

 private:
  AsyncConfig config_{};
};

class PoolBuilder {
 public:
  explicit PoolBuilder(std::size_t nWorkers) { config_.nWorkers = nWorkers; }
  PoolBuilder& channel_capacity(std::size_t n) {
    config_.channelCapacity = n;
    return *this;
  }
  PoolBuilder& thread_prefix(std::string prefix) {
    config_.threadPrefix = std::move(prefix);
    return *this;
  }
  PoolBuilder& page_slots(std::size_t n) {
    config_.pageSlots = n;
    return *this;
  }
  const PoolConfig& config() const noexcept { return config_; }
  Pool start() const;

 private:
  PoolConfig config_{};
};

class Builder {
 public:
  static LocalBuilder local() { return LocalBuilder{}; }
  static AsyncBuilder async_runtime() { return AsyncBuilder{}; }
  static PoolBuilder pool(std::size_t nWorkers) { return PoolBuilder{nWorkers}; }
};

} // namespace tether::handle
