#include "sandshell/sandbox/outcome.hpp"

#include <type_traits>

namespace sandshell::sandbox {

std::string format_outcome(const ExecutionOutcome &outcome) {
  return std::visit(
      [](auto &&result) -> std::string {
        using T = std::decay_t<decltype(result)>;
        if constexpr (std::is_same_v<T, CompletedOutcome>) {
          std::string output = result.stdout_text;
          if (!result.stderr_text.empty()) {
            output += kStderrLabel;
            output += result.stderr_text;
          }
          if (result.exit_code != 0) {
            output += kExitCodePrefix;
            output += std::to_string(result.exit_code) + "]";
          }
          return output.empty() ? std::string(kNoOutput) : output;
        } else if constexpr (std::is_same_v<T, TimedOutOutcome>) {
          const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(result.timeout);
          return "[Error: Command timed out after " + std::to_string(seconds.count()) +
                 " seconds]";
        } else if constexpr (std::is_same_v<T, ToolMissingOutcome>) {
          return std::string(kToolMissing);
        } else {
          return "[Error executing command: " + result.message + "]";
        }
      },
      outcome);
}

std::string_view outcome_kind(const ExecutionOutcome &outcome) {
  if (std::holds_alternative<CompletedOutcome>(outcome)) {
    return "completed";
  }
  if (std::holds_alternative<TimedOutOutcome>(outcome)) {
    return "timeout";
  }
  if (std::holds_alternative<ToolMissingOutcome>(outcome)) {
    return "tool_missing";
  }
  return "launch_failed";
}

} // namespace sandshell::sandbox
