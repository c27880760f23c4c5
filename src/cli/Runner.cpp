/***
 * Name: tether::cli::Run
 * Purpose: Drive one tether-run invocation through an async runtime.
 */
#include "tether/cli/Runner.h"
#include "tether/catch/CallResult.h"
#include "tether/exceptions/file_read_error.h"
#include "tether/handle/AsyncHandle.h"
#include "tether/handle/Builder.h"
#include "tether/memory/Frame.h"
#include "tether/memory/Value.h"
#include "tether/observability/Metrics.h"
#include "tether/runtime/c_api.h"
#include "tether/support/Debug.h"
#include <map>
#include <ostream>
#include <string>
#include <string_view>

namespace tether::cli {

namespace {

constexpr std::string_view kRed = "\033[31m";
constexpr std::string_view kReset = "\033[0m";

void print_error(std::ostream& err, const std::string& what, const std::string& message, bool color) {
  err << "tether-run: ";
  if (color) {
    err << kRed << "error: " << kReset;
  } else {
    err << "error: ";
  }
  err << what << ": " << message << "\n";
}

void record_gc_stats(obs::Metrics& report, const tether_gc_stats_t& stats) {
  report.setGauge("gc.num_allocated", stats.num_allocated);
  report.setGauge("gc.num_freed", stats.num_freed);
  report.setGauge("gc.num_collections", stats.num_collections);
  report.setGauge("gc.bytes_allocated", stats.bytes_allocated);
  report.setGauge("gc.bytes_live", stats.bytes_live);
  report.setGauge("gc.peak_bytes_live", stats.peak_bytes_live);
}

// Returns false after reporting the first failure.
bool run_inputs(handle::AsyncHandle& runtime, const Options& opts, std::ostream& out, std::ostream& err, bool color) {
  for (const std::string& path : opts.inputs) {
    CallResult<void> included;
    try {
      included = runtime.include(path).dispatch().join();
    } catch (const exceptions::FileReadError& e) {
      print_error(err, path, e.what(), color);
      return false;
    }
    if (!included) {
      print_error(err, path, included.error().message, color);
      return false;
    }
  }
  for (const std::string& expr : opts.expressions) {
    CallResult<std::string> rendered = runtime
                                           .blocking_task([expr](memory::GcFrame& frame) -> CallResult<std::string> {
                                             CallResult<Value> value = Value::eval_string(frame, expr);
                                             if (!value) { return std::unexpected(std::move(value.error())); }
                                             return value->render();
                                           })
                                           .dispatch()
                                           .join();
    if (!rendered) {
      print_error(err, expr, rendered.error().message, color);
      return false;
    }
    out << *rendered << "\n";
  }
  return true;
}

} // namespace

int Run(const Options& opts, std::ostream& out, std::ostream& err) {
  obs::Metrics report;
  report.start("total");
  const bool color = ResolveColor(opts.color);

  report.start("startup");
  handle::AsyncHandle runtime = handle::Builder::async_runtime()
                                    .n_workers(opts.nWorkers)
                                    .channel_capacity(opts.channelCapacity)
                                    .thread_prefix("tether-run")
                                    .start();
  report.stop("startup");
  const CallResult<bool> colorSet = runtime.error_color(color).dispatch().join();
  if (!colorSet) { support::debug_log("cli", "error color not applied: %s", colorSet.error().message.c_str()); }

  report.start("run");
  const bool ok = run_inputs(runtime, opts, out, err, color);
  report.stop("run");

  const CallResult<tether_gc_stats_t> stats =
      runtime.blocking_task([](memory::GcFrame&) { return tether_rt_gc_stats(); }).dispatch().join();
  runtime.close();
  report.stop("total");

  if (opts.metrics || opts.metricsJson) {
    for (const auto& [key, val] : runtime.metrics().counters()) { report.setCounter(key, val); }
    if (stats) { record_gc_stats(report, *stats); }
    out << (opts.metricsJson ? report.summaryJson() : report.summaryText());
  }
  return ok ? 0 : 1;
}

} // namespace tether::cli
