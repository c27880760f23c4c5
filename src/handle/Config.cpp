/***
 * Name: tether::handle::validate
 * Purpose: Reject handle options that cannot start a runtime.
 */
#include "tether/handle/Config.h"
#include "tether/exceptions/config_error.h"
#include <string>

namespace tether::handle {

namespace {
void check_page_slots(std::size_t pageSlots) {
  if (pageSlots < memory::StackPage::kMinSlots) {
    throw exceptions::ConfigError("page_slots must be at least " + std::to_string(memory::StackPage::kMinSlots) +
                                  ", got " + std::to_string(pageSlots));
  }
}
} // namespace

void validate(const LocalConfig& config) { check_page_slots(config.pageSlots); }

void validate(const AsyncConfig& config) {
  check_page_slots(config.pageSlots);
  if (config.maxConcurrentTasks == 0) { throw exceptions::ConfigError("max_concurrent_tasks must be at least 1"); }
  if (config.threadPrefix.empty()) { throw exceptions::ConfigError("thread_prefix must not be empty"); }
}

void validate(const PoolConfig& config) {
  check_page_slots(config.pageSlots);
  if (config.nWorkers == 0) { throw exceptions::ConfigError("a pool needs at least one worker"); }
  if (config.threadPrefix.empty()) { throw exceptions::ConfigError("thread_prefix must not be empty"); }
}

} // namespace tether::handle
