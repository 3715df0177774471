#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    const char *DEFAULT_LOG_FILE = "./logs/firewatch.log";
    const char *LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
}

class file_sink : public spdlog::sinks::base_sink<std::mutex>
{
public:
    explicit file_sink(const std::string &log_filename = DEFAULT_LOG_FILE)
        : device_path_(log_filename)
    {
        // 1. 确保目录存在
        std::string dir = std::filesystem::path(log_filename).parent_path().string();
        std::error_code ec;
        if (!dir.empty() && !std::filesystem::exists(dir, ec))
        {
            std::filesystem::create_directories(dir, ec);
        }
        // 2. 打开文件（追加模式）
        fout_.open(log_filename, std::ios_base::app);

        // 3. 检查是否成功
        if (!fout_.is_open())
        {
            std::cerr << "Failed to open log file: " << device_path_ << std::endl;
        }
    }

protected:
    void sink_it_(const spdlog::details::log_msg &msg) override
    {
        if (!fout_.is_open())
        {
            return; // 文件不可写时只保留控制台输出
        }

        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);
        fout_ << fmt::to_string(formatted);

        // 警告及以上级别立即落盘
        if (msg.level >= spdlog::level::warn)
        {
            fout_.flush();
        }
    }

    void flush_() override
    {
        if (fout_.is_open())
        {
            fout_.flush();
        }
    }

private:
    std::string device_path_;
    std::ofstream fout_;
};

namespace logging
{

    namespace detail
    {
        std::shared_ptr<spdlog::logger> &global_logger()
        {
            static std::shared_ptr<spdlog::logger> instance;
            return instance;
        }

        std::shared_ptr<spdlog::logger> make_logger(const std::string &log_file)
        {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(spdlog::level::trace);
            console_sink->set_pattern(LOG_PATTERN);

            auto file_sink_instance = std::make_shared<file_sink>(log_file);
            file_sink_instance->set_level(spdlog::level::trace);
            file_sink_instance->set_pattern(LOG_PATTERN);

            auto logger = std::make_shared<spdlog::logger>("firewatch", spdlog::sinks_init_list{console_sink, file_sink_instance});
            logger->set_level(spdlog::level::info);
            return logger;
        }

        std::mutex &logger_mutex()
        {
            static std::mutex m;
            return m;
        }
    }

    void init_logger(const std::string &log_file, const std::string &level)
    {
        auto logger = detail::make_logger(log_file.empty() ? DEFAULT_LOG_FILE : log_file);
        logger->set_level(spdlog::level::from_str(level)); // spdlog 对无法识别的字符串返回 off，此时回落为 info
        if (level != "off" && logger->level() == spdlog::level::off)
        {
            logger->set_level(spdlog::level::info);
        }

        {
            std::lock_guard<std::mutex> lock(detail::logger_mutex());
            detail::global_logger() = logger;
        }
        logger->info("Global logger initialized, file={}, level={}", log_file, spdlog::level::to_string_view(logger->level()));
    }

    std::shared_ptr<spdlog::logger> get_logger()
    {
        std::lock_guard<std::mutex> lock(detail::logger_mutex());
        auto &logger = detail::global_logger();
        if (!logger)
        {
            logger = detail::make_logger(DEFAULT_LOG_FILE);
            logger->info("Global logger initialized");
        }
        return logger;
    }

    void set_log_level(spdlog::level::level_enum level)
    {
        auto logger = get_logger();
        logger->set_level(level);
    }

} // namespace logging
