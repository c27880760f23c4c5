/**
 * @file
 * @brief Declarations for tether-run argument parsing helpers.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

#include "tether/cli/Options.h"
#include "tether/cli/ColorMode.h"

namespace tether::cli::detail {

/** True when `arg` is `longName` or, if one is given, `shortName`. */
bool isFlag(std::string_view arg, std::string_view longName, std::string_view shortName = {});

/** Parse `--color=<value>` to ColorMode with default fallback. */
ColorMode parseColorValue(std::string_view value);

/** Parse the count of `--workers=<N>` / `--capacity=<N>`; throws ConfigError when invalid. */
std::size_t parseCountValue(std::string_view option, std::string_view value);

/** Append every item of `rest` (the argv tail after `--`) to the input paths. */
void collectRemainingAsInputs(std::span<char* const> rest, Options& out);

/** Detect unknown option-like arguments beginning with '-' that aren't supported. */
bool isUnknownOptionArg(std::string_view arg);

/** Validate incompatible modes (--metrics with --metrics-json). */
bool hasConflictingModes(const Options& opts);

/** Handle boolean, flag-only options like -h and --metrics. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (workers, capacity, color). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

/** Handle `-e <expr>` by consuming the next argv item; throws ConfigError when it is missing. */
bool handleExpressionFlag(int& idx, int argc, char** argv, Options& out);

} // namespace tether::cli::detail
