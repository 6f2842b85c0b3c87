#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace sandshell::sandbox {

/// uid substituted when the effective uid of the caller is unknown.
inline constexpr uid_t kOverflowUid = 65534;

/// Longest deadline accepted from config or the command line (one week).
/// Policies built from larger options are clamped to it.
inline constexpr std::chrono::seconds kMaxTimeout{7 * 24 * 60 * 60};

/// Tunables shared by every invocation. The defaults are the hardened profile.
struct SandboxOptions {
  std::string bwrap_path = "bwrap";
  std::chrono::seconds timeout{60};
  bool drop_capabilities = true;
  std::vector<std::string> forward_env = {"LANG", "COLORTERM", "EDITOR", "VISUAL", "PAGER"};
  std::vector<std::string> forward_env_prefixes = {"LC_"};
  std::string fallback_path = "/usr/bin:/bin:/usr/sbin:/sbin";
  std::string fallback_home = "/tmp";
  std::string fallback_user = "sandbox";
  std::string fallback_workdir = "/tmp";
  std::string shell = "/bin/sh";
};

/// Everything the policy builder is allowed to learn about the caller.
struct AmbientContext {
  std::map<std::string, std::string> env;
  std::optional<uid_t> effective_uid;
  std::optional<std::string> cwd;
};

struct SandboxPolicy {
  // Host paths exposed read-only as (source, destination).
  std::vector<std::pair<std::string, std::string>> ro_binds;
  std::string dev_mount;
  std::string proc_mount;
  // Fresh in-memory mounts. These and extra_dirs are the only writable paths.
  std::vector<std::string> tmpfs_dirs;
  std::vector<std::string> extra_dirs;
  std::vector<std::string> unshare;
  bool drop_all_capabilities = false;
  std::vector<std::pair<std::string, std::string>> env;
  std::string workdir;
  bool die_with_parent = true;
  bool new_session = true;
  std::chrono::seconds timeout{60};
  std::string bwrap_path;
  std::string shell;
};

/// Snapshot of the calling process: environ, geteuid() and the working
/// directory (PWD first, getcwd() otherwise).
[[nodiscard]] AmbientContext capture_ambient_context();

[[nodiscard]] SandboxPolicy build_policy(const SandboxOptions &options,
                                         const AmbientContext &ambient);

/// Renders the bwrap argument vector, front-end binary first. Flag groups keep
/// the order bwrap expects: global flags, mounts, namespaces, capabilities,
/// environment, working directory and session, then the command.
[[nodiscard]] std::vector<std::string> build_bwrap_args(const SandboxPolicy &policy,
                                                        std::string_view command);

} // namespace sandshell::sandbox
