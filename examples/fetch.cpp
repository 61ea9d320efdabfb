#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "courier/courier.hpp"

using namespace courier;

static void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [options] URL...\n"
            << "  -X METHOD            request method (default GET)\n"
            << "  -H 'Name: value'     add a header (repeatable)\n"
            << "  -d BODY              request body\n"
            << "  --timeout MS         request deadline\n"
            << "  --keepalive MS       idle TTL for pooled connections, <= 0 disables reuse\n"
            << "  --max-redirects N    redirect limit\n"
            << "  --no-redirects       do not follow redirects\n"
            << "  --insecure           skip TLS verification\n"
            << "  --proxy URL          http://[user:pass@]host:port\n"
            << "  --as MODE            stream | byte-array | text | auto\n"
            << "  --config FILE        client config (JSON)\n"
            << "  -v                   debug logging to stderr\n";
}

static void print_response(const std::string& url, const Response& response) {
  std::cout << "==> " << url << "\n";
  if (response.error) {
    std::cout << "error: " << response.error->describe() << "\n\n";
    return;
  }

  std::cout << response.status << "  (" << response.url << ", connection #" << response.connection_id
            << (response.connection_reused ? " reused" : "") << ")\n";
  for (const auto& redirect : response.redirects) {
    std::cout << "  via " << redirect << "\n";
  }
  for (const auto& [name, value] : response.headers) {
    std::cout << name << ": " << value << "\n";
  }
  std::cout << "\n";

  if (response.body.kind == http::Body::Kind::Stream) {
    std::string chunk;
    while (response.body.stream->read(chunk)) {
      std::cout << chunk;
    }
    if (auto error = response.body.stream->error()) {
      std::cout << "\nerror: " << error->describe();
    }
  } else {
    std::cout << response.body.data;
  }
  std::cout << "\n\n";
}

int main(int argc, char* argv[]) {
  Request base;
  std::vector<std::string> urls;
  std::string config_file;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&]() -> std::string {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " needs a value\n";
        std::exit(2);
      }
      return argv[++i];
    };

    try {
      if (arg == "-X") {
        base.method = next();
      } else if (arg == "-H") {
        auto header = next();
        auto colon = header.find(':');
        if (colon == std::string::npos) {
          std::cerr << "Error: malformed header '" << header << "'\n";
          return 2;
        }
        auto value = header.substr(colon + 1);
        value.erase(0, value.find_first_not_of(' '));
        base.headers.add(header.substr(0, colon), value);
      } else if (arg == "-d") {
        base.body = next();
        if (base.method == "GET") base.method = "POST";
      } else if (arg == "--timeout") {
        base.timeout_ms = std::stoll(next());
      } else if (arg == "--keepalive") {
        base.keepalive_ms = std::stoll(next());
      } else if (arg == "--max-redirects") {
        base.max_redirects = std::stoi(next());
      } else if (arg == "--no-redirects") {
        base.follow_redirects = false;
      } else if (arg == "--insecure") {
        base.insecure = true;
      } else if (arg == "--proxy") {
        base.proxy = next();
      } else if (arg == "--as") {
        auto mode = coercion_from_string(next());
        if (!mode) {
          std::cerr << "Error: unknown coercion mode\n";
          return 2;
        }
        base.as = *mode;
      } else if (arg == "--config") {
        config_file = next();
      } else if (arg == "-v") {
        verbose = true;
      } else if (arg == "-h" || arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << "courier_fetch " << courier::version() << "\n";
        return 0;
      } else if (!arg.empty() && arg[0] == '-') {
        std::cerr << "Error: unknown option " << arg << "\n";
        print_usage(argv[0]);
        return 2;
      } else {
        urls.push_back(arg);
      }
    } catch (const std::exception& e) {
      std::cerr << "Error: invalid value for " << arg << ": " << e.what() << "\n";
      return 2;
    }
  }

  if (urls.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  // ----- 加载配置 -----
  ClientConfig config = config_file.empty() ? ClientConfig::from_env() : ClientConfig::load(config_file);
  init_log(config.log_file ? config.log_file->string() : "", verbose ? "debug" : config.log_level);

  Client client(config);

  // 并发发出所有请求，再按顺序等待结果
  std::vector<Future<Response>> futures;
  for (const auto& url : urls) {
    Request request = base;
    request.url = url;
    futures.push_back(client.request(std::move(request)));
  }

  int failures = 0;
  for (size_t i = 0; i < urls.size(); ++i) {
    auto response = futures[i].get();
    if (response.failed()) ++failures;
    print_response(urls[i], response);
  }

  client.shutdown();
  return failures == 0 ? 0 : 1;
}
