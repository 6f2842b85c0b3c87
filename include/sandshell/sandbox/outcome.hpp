#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace sandshell::sandbox {

struct CompletedOutcome {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

struct TimedOutOutcome {
  std::chrono::milliseconds timeout{0};
};

struct ToolMissingOutcome {
  std::string tool;
};

struct LaunchFailedOutcome {
  std::string message;
};

using ExecutionOutcome =
    std::variant<CompletedOutcome, TimedOutOutcome, ToolMissingOutcome, LaunchFailedOutcome>;

// Callers match on these substrings; changing them breaks them.
inline constexpr std::string_view kStderrLabel = "\n[stderr]:\n";
inline constexpr std::string_view kExitCodePrefix = "\n[Exit code: ";
inline constexpr std::string_view kNoOutput = "[No output]";
inline constexpr std::string_view kToolMissing =
    "[Error: bubblewrap (bwrap) not found. Please install bubblewrap: apt-get install bubblewrap]";

/// Maps an outcome onto the text returned to the caller:
///   Completed     stdout, then "\n[stderr]:\n<stderr>" and "\n[Exit code: N]" when
///                 applicable, or "[No output]" when all of that is empty.
///   TimedOut      "[Error: Command timed out after N seconds]"
///   ToolMissing   kToolMissing
///   LaunchFailed  "[Error executing command: <message>]"
[[nodiscard]] std::string format_outcome(const ExecutionOutcome &outcome);

/// "completed", "timeout", "tool_missing" or "launch_failed".
[[nodiscard]] std::string_view outcome_kind(const ExecutionOutcome &outcome);

} // namespace sandshell::sandbox
