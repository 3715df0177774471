// logger.hpp
#pragma once

#include <memory>
#include <string>
#include <spdlog/logger.h>
#include <spdlog/sinks/base_sink.h>

namespace logging {

// 初始化全局日志记录器(日志文件路径 + 日志级别)，重复调用会替换已有实例
void init_logger(const std::string &log_file, const std::string &level);

// 获取全局日志记录器
std::shared_ptr<spdlog::logger> get_logger();

// 设置全局日志级别
void set_log_level(spdlog::level::level_enum level);

namespace detail {

// 内部用于存储全局日志记录器实例
std::shared_ptr<spdlog::logger>& global_logger();

// 创建带控制台和文件输出的日志记录器
std::shared_ptr<spdlog::logger> make_logger(const std::string &log_file);

} // namespace detail

} // namespace logging
