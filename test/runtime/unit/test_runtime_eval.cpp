/***
 * Name: test_runtime_eval
 * Purpose: Evaluator basics: arithmetic, definitions, rendering and raised exceptions.
 */
#include <gtest/gtest.h>
#include "tether/runtime/All.h"
#include "tether/runtime/c_api.h"
#include <cstdint>
#include <string>

using namespace tether::rt;

namespace {
struct EvalCall {
  const char* source;
  void* value;
};

int eval_trampoline(void* callback, void* /*result*/) {
  auto* call = static_cast<EvalCall*>(callback);
  call->value = eval_string(call->source);
  return 0;
}

class RuntimeEval : public ::testing::Test {
 protected:
  void SetUp() override {
    reset_for_tests();
    ASSERT_EQ(init(), 0);
    ASSERT_EQ(adopt_thread(), 0);
  }
  void TearDown() override {
    release_thread();
    atexit_hook(0);
  }
};
} // namespace

TEST_F(RuntimeEval, Arithmetic) {
  EXPECT_EQ(box_int_value(eval_string("(+ 1 2)")), 3);
  EXPECT_EQ(box_int_value(eval_string("(* (- 10 4) 2)")), 12);
  EXPECT_EQ(box_int_value(eval_string("(/ 7 2)")), 3);
  EXPECT_DOUBLE_EQ(box_float_value(eval_string("(/ 7.0 2)")), 3.5);
  EXPECT_TRUE(box_bool_value(eval_string("(< 1 2)")));
}

TEST_F(RuntimeEval, DefineAndCall) {
  (void)eval_string("(define (square x) (* x x))");
  EXPECT_EQ(box_int_value(eval_string("(square 9)")), 81);
  (void)eval_string("(define answer 42)");
  void* bound = global_get("answer");
  ASSERT_NE(bound, nullptr);
  EXPECT_EQ(box_int_value(bound), 42);
}

TEST_F(RuntimeEval, RenderValues) {
  EXPECT_EQ(render_text(eval_string("(list 1 \"a\" 2.0)")), "[1, \"a\", 2.0]");
  EXPECT_EQ(render_text(nothing()), "nothing");
  EXPECT_EQ(render_text(eval_string("(string \"x\" 1)")), "x1");
}

TEST_F(RuntimeEval, RaiseUnwindsToTryCatch) {
  EvalCall call{"(error \"boom\")", nullptr};
  const tether_catch_t caught = tether_rt_try_catch(&call, &eval_trampoline, nullptr);
  ASSERT_EQ(caught.tag, TETHER_CATCH_EXCEPTION);
  ASSERT_NE(caught.error, nullptr);
  EXPECT_EQ(render_text(caught.error), "ErrorException: boom");
  clear_exception();
  EXPECT_EQ(current_exception(), nullptr);
}

TEST_F(RuntimeEval, UndefinedNameRaises) {
  EvalCall call{"missing_name", nullptr};
  const tether_catch_t caught = tether_rt_try_catch(&call, &eval_trampoline, nullptr);
  ASSERT_EQ(caught.tag, TETHER_CATCH_EXCEPTION);
  EXPECT_EQ(render_text(caught.error), "UndefVarError: missing_name not defined");
  clear_exception();
}

TEST_F(RuntimeEval, OkTagReturnsValue) {
  EvalCall call{"(+ 20 22)", nullptr};
  const tether_catch_t caught = tether_rt_try_catch(&call, &eval_trampoline, nullptr);
  ASSERT_EQ(caught.tag, TETHER_CATCH_OK);
  EXPECT_EQ(box_int_value(call.value), 42);
}

TEST_F(RuntimeEval, ErrorColorToggle) {
  EXPECT_FALSE(set_error_color(true));
  EXPECT_TRUE(error_color());
  EXPECT_TRUE(set_error_color(false));
}

TEST_F(RuntimeEval, IntegerArithmeticWrapsAtLimits) {
  EXPECT_EQ(box_int_value(eval_string("(+ 9223372036854775807 1)")), INT64_MIN);
  EXPECT_EQ(box_int_value(eval_string("(- -9223372036854775808 1)")), INT64_MAX);
  EXPECT_EQ(box_int_value(eval_string("(* 9223372036854775807 2)")), -2);
  EXPECT_EQ(box_int_value(eval_string("(- -9223372036854775808)")), INT64_MIN);
  EXPECT_EQ(box_int_value(eval_string("(/ -9223372036854775808 1)")), INT64_MIN);
}

TEST_F(RuntimeEval, MinIntDividedByMinusOneRaisesDivideError) {
  EvalCall call{"(/ -9223372036854775808 -1)", nullptr};
  const tether_catch_t caught = tether_rt_try_catch(&call, &eval_trampoline, nullptr);
  ASSERT_EQ(caught.tag, TETHER_CATCH_EXCEPTION);
  EXPECT_EQ(render_text(caught.error), "DivideError: integer division error");
  clear_exception();
}

TEST_F(RuntimeEval, DivisionByZeroRaisesDivideError) {
  EvalCall call{"(/ 1 0)", nullptr};
  const tether_catch_t caught = tether_rt_try_catch(&call, &eval_trampoline, nullptr);
  ASSERT_EQ(caught.tag, TETHER_CATCH_EXCEPTION);
  EXPECT_EQ(render_text(caught.error), "DivideError: integer division error");
  clear_exception();
}

TEST_F(RuntimeEval, IncludeOfMissingFileRaisesSystemError) {
  struct Include {
    static int run(void* /*callback*/, void* /*result*/) {
      (void)include_file("/no/such/dir/script.tl");
      return 0;
    }
  };
  const tether_catch_t caught = tether_rt_try_catch(nullptr, &Include::run, nullptr);
  ASSERT_EQ(caught.tag, TETHER_CATCH_EXCEPTION);
  EXPECT_EQ(render_text(caught.error), "SystemError: cannot open /no/such/dir/script.tl");
  clear_exception();
}
