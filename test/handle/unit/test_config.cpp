/***
 * Name: test_config
 * Purpose: Handle option validation and builder defaults.
 */
#include <gtest/gtest.h>
#include "tether/exceptions/config_error.h"
#include "tether/handle/AsyncHandle.h"
#include "tether/handle/Builder.h"
#include "tether/handle/Config.h"
#include "tether/handle/Pool.h"
#include "tether/handle/LocalHandle.h"
#include <string>

using namespace tether::handle;
using tether::exceptions::ConfigError;

TEST(HandleConfig, DefaultsAreValid) {
  EXPECT_NO_THROW(validate(LocalConfig{}));
  EXPECT_NO_THROW(validate(AsyncConfig{}));
  EXPECT_NO_THROW(validate(PoolConfig{}));
}

TEST(HandleConfig, PageSlotsHaveAFloor) {
  LocalConfig local;
  local.pageSlots = 8;
  try {
    validate(local);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_EQ(std::string(e.what()), "page_slots must be at least 64, got 8");
  }
}

TEST(HandleConfig, AsyncRejectsZeroConcurrencyAndEmptyPrefix) {
  AsyncConfig a;
  a.maxConcurrentTasks = 0;
  EXPECT_THROW(validate(a), ConfigError);
  AsyncConfig b;
  b.threadPrefix.clear();
  EXPECT_THROW(validate(b), ConfigError);
}

TEST(HandleConfig, PoolNeedsWorkers) {
  PoolConfig config;
  config.nWorkers = 0;
  EXPECT_THROW(validate(config), ConfigError);
}

TEST(HandleConfig, BuildersCarryOptions) {
  const AsyncBuilder builder = Builder::async_runtime().n_workers(3).channel_capacity(16).max_concurrent_tasks(4)
                                   .thread_prefix("svc");
  EXPECT_EQ(builder.config().nWorkers, 3u);
  EXPECT_EQ(builder.config().channelCapacity, 16u);
  EXPECT_EQ(builder.config().maxConcurrentTasks, 4u);
  EXPECT_EQ(builder.config().threadPrefix, "svc");
  EXPECT_EQ(Builder::pool(2).channel_capacity(5).config().nWorkers, 2u);
}

TEST(HandleConfig, BuildersValidateBeforeStarting) {
  EXPECT_THROW((void)Builder::pool(0).start(), ConfigError);
  EXPECT_THROW((void)Builder::local().page_slots(1).start(), ConfigError);
  EXPECT_THROW((void)Builder::async_runtime().thread_prefix("").start(), ConfigError);
}
