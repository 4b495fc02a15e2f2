#ifndef APPLICATION_HPP
#define APPLICATION_HPP

#include "CommandLine.hpp"
#include "NormalizationRunner.hpp"
#include "RunReport.hpp"
#include "Settings.hpp"

#include <ostream>

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitNeedsAttention = 1;
inline constexpr int kExitUsageError = 2;

// Command-line values replace the configured ones.
void apply_overrides(const CommandLineOptions& options, Settings& settings);

// Throws ErrorCodes::AppException (VALIDATION_EMPTY_FIELD) without a root or any extension.
RunOptions build_run_options(const CommandLineOptions& options, const Settings& settings);

int exit_code_for(const RunReport& report, bool report_failed);

/**
 * @brief Runs the tool for one argv and returns the process exit status.
 *
 * Help and version text go to @p out. Usage, configuration and setup errors
 * propagate as exceptions; per-file failures are folded into the exit status.
 */
int run_application(int argc, const char* const* argv, std::ostream& out);

// run_application() with every exception logged and mapped to kExitUsageError.
int guarded_run_application(int argc, const char* const* argv, std::ostream& out);

#endif
