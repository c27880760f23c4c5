/***
 * Name: tether::handle::Builder (start)
 * Purpose: Validate options and start the requested handle.
 */
#include "tether/handle/Builder.h"
#include "tether/handle/AsyncHandle.h"
#include "tether/handle/LocalHandle.h"
#include "tether/handle/Pool.h"

namespace tether::handle {

LocalHandle LocalBuilder::start() const {
  validate(config_);
  return LocalHandle(config_);
}

AsyncHandle AsyncBuilder::start() const {
  validate(config_);
  return AsyncHandle(config_);
}

Pool PoolBuilder::start() const {
  validate(config_);
  return Pool(config_);
}

} // namespace tether::handle
