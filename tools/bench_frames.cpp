/**
 * Frame benchmark: push/pop and rooting throughput for each frame kind on a local handle.
 * Usage: bench_frames [iters] [roots]
 */
#include "tether/handle/Builder.h"
#include "tether/handle/LocalHandle.h"
#include "tether/memory/Frame.h"
#include "tether/memory/Value.h"
#include "tether/runtime/c_api.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace tether;

int main(int argc, char** argv) {
  std::size_t iters = (argc > 1) ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 200000;
  std::size_t roots = (argc > 2) ? static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10)) : 4;
  constexpr std::size_t kLocalSlots = 4;
  if (roots > kLocalSlots) { roots = kLocalSlots; }

  handle::LocalHandle local = handle::Builder::local().start();

  auto report = [&](const char* name, auto&& body) {
    const auto t0 = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iters; ++i) { body(static_cast<int64_t>(i)); }
    const auto t1 = std::chrono::steady_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
    const tether_gc_stats_t st = tether_rt_gc_stats();
    std::cout << "[" << name << "]"
              << " iters=" << iters
              << " roots=" << roots
              << " time_us=" << us
              << " collections=" << st.num_collections
              << " bytes_live=" << st.bytes_live
              << " peak_live=" << st.peak_bytes_live
              << " stack_pages=" << local.stack().n_pages()
              << "\n";
  };

  report("gc_frame", [&](int64_t i) {
    local.scope([&](memory::GcFrame& frame) {
      for (std::size_t r = 0; r < roots; ++r) { (void)Value::new_int(frame, i); }
    });
  });
  report("local_frame", [&](int64_t i) {
    local.local_scope<kLocalSlots>([&](memory::LocalFrame<kLocalSlots>& frame) {
      for (std::size_t r = 0; r < roots; ++r) { (void)Value::new_int(frame, i); }
    });
  });
  report("unsized_frame", [&](int64_t i) {
    local.unsized_local_scope(roots, [&](memory::UnsizedFrame& frame) {
      for (std::size_t r = 0; r < roots; ++r) { (void)Value::new_int(frame, i); }
    });
  });
  report("nested_output", [&](int64_t i) {
    local.scope([&](memory::GcFrame& outer) {
      memory::Output out = outer.output();
      outer.scope([&](memory::GcFrame& inner) {
        (void)Value::new_int(inner, i);
        (void)Value::new_int(out, i);
      });
    });
  });
  return 0;
}
