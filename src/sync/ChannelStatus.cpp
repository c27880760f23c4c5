/***
 * Name: tether::sync::to_string(ChannelStatus)
 * Purpose: Display names for channel status codes.
 */
#include "tether/sync/Channel.h"

namespace tether::sync {

const char* to_string(ChannelStatus status) {
  switch (status) {
    case ChannelStatus::Ok: return "Ok";
    case ChannelStatus::Full: return "Full";
    case ChannelStatus::Closed: return "Closed";
    case ChannelStatus::Empty: return "Empty";
  }
  return "Unknown";
}

} // namespace tether::sync
