#include "excelpipe/utils/Logger.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <thread>
#include <chrono>
#include <cctype>
#include <fmt/chrono.h>

#ifdef _WIN32
#include <windows.h>
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace excelpipe {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files,
                        WriteMode write_mode) {
    if (shutting_down_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // 允许重复初始化：测试和命令行会在运行期调整输出目标
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }

    current_level_.store(level);
    enable_console_.store(enable_console);
    log_file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = std::max<size_t>(max_files, 1);
    write_mode_ = write_mode;
    current_file_size_.store(0);

    if (!log_file_path_.empty()) {
        std::error_code ec;
        std::filesystem::path log_path(log_file_path_);
        std::filesystem::path log_dir = log_path.parent_path();
        if (!log_dir.empty()) {
            std::filesystem::create_directories(log_dir, ec);
        }
        if (ec) {
            std::cerr << "Logger: cannot create log directory " << log_dir.string()
                      << ": " << ec.message() << std::endl;
        } else {
            std::ios::openmode open_mode = (write_mode_ == WriteMode::APPEND) ?
                                           (std::ios::out | std::ios::app) :
                                           (std::ios::out | std::ios::trunc);
            file_stream_.open(log_file_path_, open_mode);
            if (file_stream_.is_open() && write_mode_ == WriteMode::APPEND) {
                file_stream_.seekp(0, std::ios::end);
                current_file_size_.store(static_cast<size_t>(file_stream_.tellp()));
            }
        }
    }

#ifdef _WIN32
    if (enable_console) {
        SetConsoleOutputCP(CP_UTF8);
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD dwMode = 0;
        if (hOut != INVALID_HANDLE_VALUE && GetConsoleMode(hOut, &dwMode)) {
            SetConsoleMode(hOut, dwMode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
        }
    }
#endif

    initialized_.store(true);

    if (should_log(Level::DEBUG)) {
        std::string msg = format_message(Level::DEBUG,
            fmt::format("Logger initialized. Log file: {}, Mode: {}",
                        log_file_path_.empty() ? "<none>" : log_file_path_,
                        (write_mode_ == WriteMode::APPEND ? "APPEND" : "TRUNCATE")));
        if (enable_console_.load()) {
            log_to_console(Level::DEBUG, msg);
        }
        log_to_file(msg);
    }
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")    return Level::TRACE;
    if (lower == "debug")    return Level::DEBUG;
    if (lower == "info")     return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error")    return Level::ERROR;
    if (lower == "critical") return Level::CRITICAL;
    if (lower == "off")      return Level::OFF;
    return fallback;
}

bool Logger::should_log(Level level) const {
    return static_cast<int>(level) >= static_cast<int>(current_level_.load()) &&
           !shutting_down_.load();
}

void Logger::log(Level level, const std::string& message) {
    if (!should_log(level)) return;

    if (!initialized_.load()) {
        initialize();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;

    std::string formatted_message = format_message(level, message);

    if (enable_console_.load()) {
        log_to_console(level, formatted_message);
    }
    log_to_file(formatted_message);

    // 警告及以上立即刷新
    if (level >= Level::WARN) {
        flush();
    }
}

void Logger::log_to_console(Level level, const std::string& message) {
    const char* color_code;
    switch (level) {
        case Level::TRACE:    color_code = "\033[37m"; break; // 白色
        case Level::DEBUG:    color_code = "\033[36m"; break; // 青色
        case Level::INFO:     color_code = "\033[32m"; break; // 绿色
        case Level::WARN:     color_code = "\033[33m"; break; // 黄色
        case Level::ERROR:    color_code = "\033[31m"; break; // 红色
        case Level::CRITICAL: color_code = "\033[35m"; break; // 紫色
        default:              color_code = "\033[0m";  break;
    }

    std::ostream& out = (level >= Level::ERROR) ? std::cerr : std::cout;
    out << color_code << message << "\033[0m" << '\n';
}

void Logger::log_to_file(const std::string& message) {
    if (!file_stream_.is_open()) {
        return;
    }

    rotate_file_if_needed();

    file_stream_ << message << '\n';
    current_file_size_.fetch_add(message.length() + 1);
}

void Logger::rotate_file_if_needed() {
    if (current_file_size_.load() < max_file_size_) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        std::string old_file = get_rotated_filename(i - 1);
        std::string new_file = get_rotated_filename(i);
        if (std::filesystem::exists(old_file, ec)) {
            std::filesystem::rename(old_file, new_file, ec);
        }
    }

    file_stream_.open(log_file_path_, std::ios::out | std::ios::trunc);
    current_file_size_.store(0);
}

std::string Logger::get_rotated_filename(size_t index) const {
    if (index == 0) {
        return log_file_path_;
    }
    return fmt::format("{}.{}", log_file_path_, index);
}

std::string Logger::format_message(Level level, const std::string& message) const {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return fmt::format("[{}] [{}] [{}] {}",
                       get_timestamp(),
                       level_to_string(level),
                       oss.str(),
                       message);
}

const char* Logger::level_to_string(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", now);
}

void Logger::flush() {
    // 调用方可能已持有锁，这里不加锁
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cout.flush();
}

void Logger::shutdown() {
    shutting_down_.store(true);

    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }

    if (initialized_.load()) {
        if (file_stream_.is_open()) {
            file_stream_.flush();
            file_stream_.close();
        }
        initialized_.store(false);
    }
}

Logger::~Logger() {
    shutdown();
}

} // namespace excelpipe
