/***
 * Name: tether::handle messages (impl)
 * Purpose: Affinity names and outcome accounting for resolved work.
 */
#include "tether/handle/Message.h"
#include "tether/observability/Metrics.h"

namespace tether::handle {

const char* to_string(Affinity affinity) {
  switch (affinity) {
    case Affinity::ToAny: return "any";
    case Affinity::ToMain: return "main";
    case Affinity::ToWorker: return "worker";
  }
  return "unknown";
}

namespace detail {

void record_outcome(obs::Metrics& metrics, const CallError* error) {
  if (error == nullptr) {
    metrics.incCounter(obs::kTasksCompleted);
  } else if (error->is_cancelled()) {
    metrics.incCounter(obs::kTasksCancelled);
  } else {
    metrics.incCounter(obs::kTasksFailed);
  }
}

} // namespace detail
} // namespace tether::handle
