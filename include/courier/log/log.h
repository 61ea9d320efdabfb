#ifndef COURIER_LOG_H
#define COURIER_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace courier {

/**
 * 初始化日志系统
 *
 * - 指定 log_path 时写入该文件（每次启动清空），否则输出到 stderr（带颜色）
 * - 安装名为 "courier" 的 logger 并设为 spdlog 默认 logger，库内部统一通过 spdlog::info 等输出
 * - 可重复调用，后一次调用替换前一次的 logger
 *
 * @param log_path 日志文件路径（可选，为空时输出到 stderr）
 * @param level 日志级别：trace/debug/info/warn/err/critical/off，默认 info
 */
void init_log(const std::string& log_path = "", const std::string& level = "info");

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace courier

#endif  // COURIER_LOG_H
