#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "courier/http/redirect.hpp"
#include "courier/http/request.hpp"
#include "courier/core/types.hpp"

namespace courier {

// Client-wide defaults. Per-request options that are set take precedence.
struct ClientConfig {
  // Deadlines (ms). connect_timeout_ms = 0 leaves acquisition under timeout_ms.
  int64_t timeout_ms = 30000;
  int64_t connect_timeout_ms = 0;

  // Idle TTL for pooled connections; <= 0 disables reuse
  int64_t keepalive_ms = 120000;

  int max_redirects = 10;
  bool follow_redirects = true;
  http::RedirectPolicy redirect_policy;

  size_t io_threads = 2;

  // Pool
  size_t max_connections_per_host = 0;  // 0 = unbounded
  int64_t pool_sweep_interval_ms = 1000;

  // Responses
  std::string default_charset = "UTF-8";
  size_t max_header_bytes = 65536;

  // Sent with every request unless the request sets the same header
  std::string user_agent = default_user_agent();
  std::map<std::string, std::string> default_headers;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file; missing or malformed files give the defaults
  static ClientConfig load(const std::filesystem::path& path);

  // ~/.config/courier/config.json when present
  static ClientConfig load_default();

  // Config file as base, then environment overrides:
  //   COURIER_CONFIG (file), COURIER_TIMEOUT_MS, COURIER_KEEPALIVE_MS,
  //   COURIER_MAX_REDIRECTS, COURIER_IO_THREADS, COURIER_LOG_LEVEL
  static ClientConfig from_env();

  static ClientConfig from_json(const json& j);

  json to_json() const;

  void save(const std::filesystem::path& path) const;

  // Fills every unset option of the request from these defaults
  void apply_defaults(http::Request& request) const;

  static std::string default_user_agent();
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();
}  // namespace config_paths

}  // namespace courier
