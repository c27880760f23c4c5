/***
 * Name: tether::handle::LocalConfig, AsyncConfig, PoolConfig
 * Purpose: Startup options for the three handle kinds.
 * Theory of Operation: Plain aggregates filled by the Builder; validate() throws ConfigError.
 */
#pragma once

#include <cstddef>
#include <string>

#include "tether/memory/StackPage.h"

namespace tether::handle {

struct LocalConfig {
  std::size_t pageSlots{memory::StackPage::kMinSlots};
};

struct AsyncConfig {
  std::size_t nWorkers{0};
  std::size_t channelCapacity{0}; // 0 = unbounded
  std::size_t maxConcurrentTasks{1};
  std::string threadPrefix{"tether"};
  std::size_t pageSlots{memory::StackPage::kMinSlots};
};

struct PoolConfig {
  std::size_t nWorkers{1};
  std::size_t channelCapacity{0}; // 0 = unbounded
  std::string threadPrefix{"tether-pool"};
  std::size_t pageSlots{memory::StackPage::kMinSlots};
};

void validate(const LocalConfig& config);
void validate(const AsyncConfig& config);
void validate(const PoolConfig& config);

} // namespace tether::handle
