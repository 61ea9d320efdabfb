#include "courier/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

#include "courier/core/version.hpp"

namespace courier {

namespace fs = std::filesystem;

namespace {

template <typename T>
void read_env_number(const char* name, T& target) {
  const char* value = std::getenv(name);
  if (!value || !*value) return;
  try {
    target = static_cast<T>(std::stoll(value));
  } catch (const std::exception& e) {
    spdlog::warn("Ignoring {}='{}': {}", name, value, e.what());
  }
}

}  // namespace

std::string ClientConfig::default_user_agent() {
  return std::string("courier/") + COURIER_VERSION_STRING;
}

ClientConfig ClientConfig::load(const fs::path& path) {
  if (!fs::exists(path)) {
    return ClientConfig{};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Cannot open config file {}", path.string());
    return ClientConfig{};
  }

  try {
    return from_json(json::parse(file));
  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse config file {}: {}", path.string(), e.what());
  }
  return ClientConfig{};
}

ClientConfig ClientConfig::load_default() {
  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }
  return ClientConfig{};
}

ClientConfig ClientConfig::from_env() {
  const char* config_file = std::getenv("COURIER_CONFIG");
  ClientConfig config = config_file && *config_file ? load(config_file) : load_default();

  read_env_number("COURIER_TIMEOUT_MS", config.timeout_ms);
  read_env_number("COURIER_KEEPALIVE_MS", config.keepalive_ms);
  read_env_number("COURIER_MAX_REDIRECTS", config.max_redirects);
  read_env_number("COURIER_IO_THREADS", config.io_threads);

  if (const char* level = std::getenv("COURIER_LOG_LEVEL")) {
    config.log_level = level;
  }
  return config;
}

ClientConfig ClientConfig::from_json(const json& j) {
  ClientConfig config;

  config.timeout_ms = j.value("timeout_ms", config.timeout_ms);
  config.connect_timeout_ms = j.value("connect_timeout_ms", config.connect_timeout_ms);
  config.keepalive_ms = j.value("keepalive_ms", config.keepalive_ms);
  config.max_redirects = j.value("max_redirects", config.max_redirects);
  config.follow_redirects = j.value("follow_redirects", config.follow_redirects);
  config.io_threads = j.value("io_threads", config.io_threads);
  config.max_connections_per_host = j.value("max_connections_per_host", config.max_connections_per_host);
  config.pool_sweep_interval_ms = j.value("pool_sweep_interval_ms", config.pool_sweep_interval_ms);
  config.default_charset = j.value("default_charset", config.default_charset);
  config.max_header_bytes = j.value("max_header_bytes", config.max_header_bytes);
  config.user_agent = j.value("user_agent", config.user_agent);

  if (j.contains("redirect_policy")) {
    const auto& policy = j["redirect_policy"];
    config.redirect_policy.rewrite_post_on_301_302 = policy.value("rewrite_post_on_301_302", true);
    if (policy.contains("statuses")) {
      config.redirect_policy.statuses.clear();
      for (const auto& status : policy["statuses"]) {
        config.redirect_policy.statuses.insert(status.get<int>());
      }
    }
  }

  if (j.contains("default_headers")) {
    for (auto& [k, v] : j["default_headers"].items()) {
      config.default_headers[k] = v.get<std::string>();
    }
  }

  config.log_level = j.value("log_level", "info");
  if (j.contains("log_file")) {
    config.log_file = j["log_file"].get<std::string>();
  }
  return config;
}

json ClientConfig::to_json() const {
  json j;
  j["timeout_ms"] = timeout_ms;
  j["connect_timeout_ms"] = connect_timeout_ms;
  j["keepalive_ms"] = keepalive_ms;
  j["max_redirects"] = max_redirects;
  j["follow_redirects"] = follow_redirects;
  j["redirect_policy"] = {{"statuses", redirect_policy.statuses}, {"rewrite_post_on_301_302", redirect_policy.rewrite_post_on_301_302}};
  j["io_threads"] = io_threads;
  j["max_connections_per_host"] = max_connections_per_host;
  j["pool_sweep_interval_ms"] = pool_sweep_interval_ms;
  j["default_charset"] = default_charset;
  j["max_header_bytes"] = max_header_bytes;
  j["user_agent"] = user_agent;
  j["default_headers"] = default_headers;
  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }
  return j;
}

void ClientConfig::save(const fs::path& path) const {
  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Cannot write config file {}", path.string());
    return;
  }
  file << to_json().dump(2);
}

void ClientConfig::apply_defaults(http::Request& request) const {
  if (!request.timeout_ms) request.timeout_ms = timeout_ms;
  if (!request.connect_timeout_ms) request.connect_timeout_ms = connect_timeout_ms;
  if (!request.keepalive_ms) request.keepalive_ms = keepalive_ms;
  if (!request.max_redirects) request.max_redirects = max_redirects;
  if (!request.follow_redirects) request.follow_redirects = follow_redirects;

  if (!request.headers.contains("User-Agent") && !user_agent.empty()) {
    request.headers.add("User-Agent", user_agent);
  }
  for (const auto& [name, value] : default_headers) {
    if (!request.headers.contains(name)) {
      request.headers.add(name, value);
    }
  }
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "courier";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace courier
