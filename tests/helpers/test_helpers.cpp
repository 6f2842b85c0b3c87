#include "tests/helpers/test_helpers.hpp"

#include "sandshell/config/config.hpp"

#include <cstdlib>
#include <fstream>
#include <random>

namespace sandshell::testing {

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ConfigOverrideGuard::ConfigOverrideGuard(std::optional<std::filesystem::path> path) {
  config::set_config_path_override(std::move(path));
}

ConfigOverrideGuard::~ConfigOverrideGuard() { config::clear_config_path_override(); }

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("sandshell-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

FakeProcessRunner::FakeProcessRunner(sandbox::ExecutionOutcome outcome)
    : outcome_(std::move(outcome)) {}

sandbox::ExecutionOutcome FakeProcessRunner::run(const std::vector<std::string> &argv,
                                                 const std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  argvs_.push_back(argv);
  last_timeout_ = timeout;
  return outcome_;
}

void FakeProcessRunner::set_outcome(sandbox::ExecutionOutcome outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  outcome_ = std::move(outcome);
}

std::size_t FakeProcessRunner::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return argvs_.size();
}

std::vector<std::string> FakeProcessRunner::last_argv() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return argvs_.empty() ? std::vector<std::string>{} : argvs_.back();
}

std::chrono::milliseconds FakeProcessRunner::last_timeout() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_timeout_;
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  events.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  metrics.push_back(metric);
}

sandbox::AmbientContext make_ambient(std::map<std::string, std::string> env) {
  sandbox::AmbientContext ambient;
  ambient.env = std::move(env);
  ambient.effective_uid = 1000;
  ambient.cwd = "/work";
  return ambient;
}

config::Config quiet_config() {
  config::Config config;
  config.observability.backend = "none";
  return config;
}

std::size_t find_token(const std::vector<std::string> &args, const std::string &token,
                       const std::size_t from) {
  for (std::size_t i = from; i < args.size(); ++i) {
    if (args[i] == token) {
      return i;
    }
  }
  return std::string::npos;
}

bool has_setenv(const std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i + 2 < args.size(); ++i) {
    if (args[i] == "--setenv" && args[i + 1] == name) {
      return true;
    }
  }
  return false;
}

} // namespace sandshell::testing
