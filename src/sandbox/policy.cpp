#include "sandshell/sandbox/policy.hpp"

#include "sandshell/common/fs.hpp"

#include <algorithm>
#include <filesystem>
#include <unistd.h>

extern char **environ;

namespace sandshell::sandbox {

namespace {

std::optional<std::string> lookup(const AmbientContext &ambient, const std::string &name) {
  const auto it = ambient.env.find(name);
  if (it == ambient.env.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool has_name(const std::vector<std::pair<std::string, std::string>> &env,
              const std::string &name) {
  return std::any_of(env.begin(), env.end(),
                     [&](const auto &pair) { return pair.first == name; });
}

bool matches_prefix(const std::string &name, const std::vector<std::string> &prefixes) {
  return std::any_of(prefixes.begin(), prefixes.end(), [&](const std::string &prefix) {
    return !prefix.empty() && common::starts_with(name, prefix);
  });
}

std::vector<std::pair<std::string, std::string>> build_env(const SandboxOptions &options,
                                                           const AmbientContext &ambient) {
  std::vector<std::pair<std::string, std::string>> env;
  env.emplace_back("PATH", lookup(ambient, "PATH").value_or(options.fallback_path));
  env.emplace_back("HOME", lookup(ambient, "HOME").value_or(options.fallback_home));
  env.emplace_back("USER", lookup(ambient, "USER").value_or(options.fallback_user));

  for (const auto &name : options.forward_env) {
    if (has_name(env, name)) {
      continue;
    }
    if (auto value = lookup(ambient, name); value.has_value()) {
      env.emplace_back(name, std::move(*value));
    }
  }

  // ambient.env is ordered, so prefix matches come out sorted by name.
  for (const auto &[name, value] : ambient.env) {
    if (matches_prefix(name, options.forward_env_prefixes) && !has_name(env, name)) {
      env.emplace_back(name, value);
    }
  }
  return env;
}

} // namespace

AmbientContext capture_ambient_context() {
  AmbientContext ambient;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view raw(*entry);
    const auto eq = raw.find('=');
    if (eq == std::string_view::npos || eq == 0) {
      continue;
    }
    ambient.env.emplace(std::string(raw.substr(0, eq)), std::string(raw.substr(eq + 1)));
  }

  ambient.effective_uid = geteuid();

  if (const auto pwd = ambient.env.find("PWD"); pwd != ambient.env.end() && !pwd->second.empty()) {
    ambient.cwd = pwd->second;
  } else {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
      ambient.cwd = cwd.string();
    }
  }
  return ambient;
}

SandboxPolicy build_policy(const SandboxOptions &options, const AmbientContext &ambient) {
  SandboxPolicy policy;
  policy.ro_binds = {{"/", "/"}};
  policy.dev_mount = "/dev";
  policy.proc_mount = "/proc";
  policy.tmpfs_dirs = {"/tmp", "/var", "/run"};

  const uid_t uid = ambient.effective_uid.value_or(kOverflowUid);
  policy.extra_dirs = {"/run/user/" + std::to_string(uid)};

  policy.unshare = {"pid", "cgroup", "ipc", "net"};
  policy.drop_all_capabilities = options.drop_capabilities;
  policy.env = build_env(options, ambient);

  policy.workdir = ambient.cwd.has_value() && !ambient.cwd->empty() ? *ambient.cwd
                                                                    : options.fallback_workdir;
  policy.die_with_parent = true;
  policy.new_session = true;
  policy.timeout = std::min(options.timeout, kMaxTimeout);
  policy.bwrap_path = options.bwrap_path;
  policy.shell = options.shell;
  return policy;
}

std::vector<std::string> build_bwrap_args(const SandboxPolicy &policy, std::string_view command) {
  std::vector<std::string> args = {policy.bwrap_path};

  if (policy.die_with_parent) {
    args.push_back("--die-with-parent");
  }

  for (const auto &[source, destination] : policy.ro_binds) {
    args.push_back("--ro-bind");
    args.push_back(source);
    args.push_back(destination);
  }
  if (!policy.dev_mount.empty()) {
    args.push_back("--dev");
    args.push_back(policy.dev_mount);
  }
  if (!policy.proc_mount.empty()) {
    args.push_back("--proc");
    args.push_back(policy.proc_mount);
  }
  for (const auto &dir : policy.tmpfs_dirs) {
    args.push_back("--tmpfs");
    args.push_back(dir);
  }
  for (const auto &dir : policy.extra_dirs) {
    args.push_back("--dir");
    args.push_back(dir);
  }

  for (const auto &ns : policy.unshare) {
    args.push_back("--unshare-" + ns);
  }

  if (policy.drop_all_capabilities) {
    args.push_back("--cap-drop");
    args.push_back("ALL");
  }

  args.push_back("--clearenv");
  for (const auto &[name, value] : policy.env) {
    args.push_back("--setenv");
    args.push_back(name);
    args.push_back(value);
  }

  args.push_back("--chdir");
  args.push_back(policy.workdir);
  if (policy.new_session) {
    args.push_back("--new-session");
  }

  args.push_back("--");
  args.push_back(policy.shell);
  args.push_back("-c");
  args.push_back(std::string(command));
  return args;
}

} // namespace sandshell::sandbox
