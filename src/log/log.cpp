#include "courier/log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

namespace courier {

void init_log(const std::string& log_path, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    spdlog::sink_ptr sink;
    if (log_path.empty()) {
      sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
      // 确保日志目录存在
      fs::path actual_path = log_path;
      std::error_code ec;
      if (actual_path.has_parent_path()) {
        fs::create_directories(actual_path.parent_path(), ec);
      }
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    }

    auto logger = std::make_shared<spdlog::logger>("courier", sink);

    // 未知级别按 info 处理
    auto log_level = spdlog::level::from_str(level);
    if (log_level == spdlog::level::off && level != "off") {
      log_level = spdlog::level::info;
    }
    logger->set_level(log_level);

    // 设置日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 警告及以上立即刷新
    logger->flush_on(spdlog::level::warn);

    // 替换同名 logger 并设为默认 logger
    spdlog::drop("courier");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::debug("logging initialized (level: {}, sink: {})", level, log_path.empty() ? "stderr" : log_path);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace courier
