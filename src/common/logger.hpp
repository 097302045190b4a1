#pragma once

// Undefine Windows ERROR macro to avoid conflict with LogLevel::ERROR
#ifdef ERROR
#undef ERROR
#endif

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <vector>

namespace agora {

// Log levels matching spdlog
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6,
};

LogLevel log_level_from_string(std::string_view str);
std::string_view log_level_to_string(LogLevel level);
spdlog::level::level_enum to_spdlog_level(LogLevel level);

// Log configuration
struct LogConfig {
    LogLevel global_level = LogLevel::INFO;

    // Console output
    bool console_enabled = true;
    bool console_color = true;

    // File output
    bool file_enabled = false;
    std::string file_path;
    size_t file_max_size = 20 * 1024 * 1024;  // 20MB
    size_t file_max_files = 5;

    // Module-specific levels ("net" applies to "net.ice" unless overridden)
    std::unordered_map<std::string, LogLevel> module_levels;

    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
};

class LogManager;

// Logger wrapper for a specific module
class Logger {
public:
    // Get logger for a module (creates if not exists)
    static Logger& get(const std::string& module);

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::TRACE, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::INFO, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::WARN, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::ERROR, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        log_impl(LogLevel::FATAL, fmt, std::forward<Args>(args)...);
    }

    void set_level(LogLevel level);
    LogLevel get_level() const;

    const std::string& module() const { return module_; }

private:
    friend class LogManager;
    Logger(const std::string& module, std::shared_ptr<spdlog::logger> logger);

    template<typename... Args>
    void log_impl(LogLevel level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (!logger_) return;

        auto spdlog_level = to_spdlog_level(level);
        if (!logger_->should_log(spdlog_level)) return;

        logger_->log(spdlog_level, fmt, std::forward<Args>(args)...);
    }

    std::string module_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Global log manager
class LogManager {
public:
    static LogManager& instance();

    // Initialize with config (AGORA_LOG_LEVEL overrides the global level)
    void init(const LogConfig& config);

    void set_global_level(LogLevel level);
    LogLevel get_global_level() const;

    void set_module_level(const std::string& module, LogLevel level);
    std::optional<LogLevel> get_module_level(const std::string& module) const;
    void clear_module_level(const std::string& module);

    // Effective level after walking the dotted parent chain
    LogLevel resolve_module_level(const std::string& module) const;

    void flush();
    void shutdown();

    Logger& get_logger(const std::string& module);

    bool is_initialized() const { return initialized_; }

private:
    LogManager() = default;
    ~LogManager();

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    void build_sinks();
    std::shared_ptr<spdlog::logger> create_logger(const std::string& name);
    LogLevel resolve_locked(const std::string& module) const;
    void refresh_levels_locked();

    mutable std::shared_mutex mutex_;
    bool initialized_ = false;
    LogConfig config_;

    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers_;
};

// Usage: AGORA_LOG_INFO("net.ice", "message {}", arg);

#define AGORA_LOG_TRACE(module, ...) ::agora::Logger::get(module).trace(__VA_ARGS__)
#define AGORA_LOG_DEBUG(module, ...) ::agora::Logger::get(module).debug(__VA_ARGS__)
#define AGORA_LOG_INFO(module, ...)  ::agora::Logger::get(module).info(__VA_ARGS__)
#define AGORA_LOG_WARN(module, ...)  ::agora::Logger::get(module).warn(__VA_ARGS__)
#define AGORA_LOG_ERROR(module, ...) ::agora::Logger::get(module).error(__VA_ARGS__)
#define AGORA_LOG_FATAL(module, ...) ::agora::Logger::get(module).fatal(__VA_ARGS__)

} // namespace agora
