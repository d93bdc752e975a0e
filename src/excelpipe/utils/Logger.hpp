#pragma once

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#endif

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace excelpipe {

/**
 * @brief 进程级日志器
 *
 * 控制台彩色输出 + 可轮转的日志文件，两者都可以关闭。
 * 所有写入都在互斥锁内完成。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志器
     * @param log_file_path 日志文件路径，为空时只输出到控制台
     * @param level 最低输出级别
     * @param enable_console 是否输出到控制台
     * @param max_file_size 单个日志文件上限，超过后轮转
     * @param max_files 保留的轮转文件数量
     * @param write_mode 覆盖或追加
     */
    void initialize(const std::string& log_file_path = "logs/excelpipe.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }

    /**
     * @brief 从字符串解析日志级别（trace/debug/info/warn/error/critical/off）
     * @return 解析失败时返回 fallback
     */
    static Level parseLevel(const std::string& name, Level fallback = Level::INFO);

    void trace(const std::string& message)    { log(Level::TRACE, message); }
    void debug(const std::string& message)    { log(Level::DEBUG, message); }
    void info(const std::string& message)     { log(Level::INFO, message); }
    void warn(const std::string& message)     { log(Level::WARN, message); }
    void error(const std::string& message)    { log(Level::ERROR, message); }
    void critical(const std::string& message) { log(Level::CRITICAL, message); }

    template<typename... Args>
    inline void trace(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::TRACE, fmt_str, args...);
    }

    template<typename... Args>
    inline void debug(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::DEBUG, fmt_str, args...);
    }

    template<typename... Args>
    inline void info(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::INFO, fmt_str, args...);
    }

    template<typename... Args>
    inline void warn(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::WARN, fmt_str, args...);
    }

    template<typename... Args>
    inline void error(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::ERROR, fmt_str, args...);
    }

    template<typename... Args>
    inline void critical(const std::string& fmt_str, Args&&... args) {
        logFormatted(Level::CRITICAL, fmt_str, args...);
    }

    void flush();
    void shutdown();

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logFormatted(level, fmt_with_ctx, args...);
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    inline void logFormatted(Level level, const std::string& fmt_str, Args&... args) {
        if (!should_log(level)) return;
        if constexpr (sizeof...(Args) == 0) {
            log(level, fmt_str);
        } else {
            try {
                log(level, fmt::vformat(fmt_str, fmt::make_format_args(args...)));
            } catch (const fmt::format_error& e) {
                // 格式串与参数不匹配时原样输出，并附带原因
                log(level, fmt_str + " <format error: " + e.what() + ">");
            }
        }
    }

    void log(Level level, const std::string& message);
    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    std::atomic<size_t> current_file_size_{0};
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::TRUNCATE;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define EXCELPIPE_FUNC __FUNCTION__
#else
#  define EXCELPIPE_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define EXCELPIPE_LOG_TRACE(fmt, ...)    ::excelpipe::Logger::getInstance().logCtx(::excelpipe::Logger::Level::TRACE,    __FILE__, __LINE__, EXCELPIPE_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPIPE_LOG_DEBUG(fmt, ...)    ::excelpipe::Logger::getInstance().logCtx(::excelpipe::Logger::Level::DEBUG,    __FILE__, __LINE__, EXCELPIPE_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPIPE_LOG_INFO(fmt, ...)     ::excelpipe::Logger::getInstance().logCtx(::excelpipe::Logger::Level::INFO,     __FILE__, __LINE__, EXCELPIPE_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPIPE_LOG_WARN(fmt, ...)     ::excelpipe::Logger::getInstance().logCtx(::excelpipe::Logger::Level::WARN,     __FILE__, __LINE__, EXCELPIPE_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPIPE_LOG_ERROR(fmt, ...)    ::excelpipe::Logger::getInstance().logCtx(::excelpipe::Logger::Level::ERROR,    __FILE__, __LINE__, EXCELPIPE_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPIPE_LOG_CRITICAL(fmt, ...) ::excelpipe::Logger::getInstance().logCtx(::excelpipe::Logger::Level::CRITICAL, __FILE__, __LINE__, EXCELPIPE_FUNC, fmt, ##__VA_ARGS__)

} // namespace excelpipe
