#include "Logger.hpp"
#include <filesystem>
#include <iostream>
#include <thread>
#include <sstream>
#include <fmt/format.h>
#include <fmt/chrono.h>

namespace odfpack {

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
    
    if (initialized_.load() || shutting_down_.load()) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    // 双重检查
    if (initialized_.load() || shutting_down_.load()) {
        return;
    }
    
    current_level_.store(level);
    enable_console_.store(enable_console);
    log_file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = max_files;
    write_mode_ = write_mode;

    if (!log_file_path_.empty()) {
        try {
            std::filesystem::path log_path(log_file_path_);
            std::filesystem::path log_dir = log_path.parent_path();
            if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
                std::filesystem::create_directories(log_dir);
            }
        } catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
        
        std::ios::openmode open_mode = (write_mode_ == WriteMode::APPEND) ? 
                                      (std::ios::out | std::ios::app) : 
                                      (std::ios::out | std::ios::trunc);
        file_stream_.open(log_file_path_, open_mode);
        if (file_stream_.is_open() && write_mode_ == WriteMode::APPEND) {
            file_stream_.seekp(0, std::ios::end);
            current_file_size_.store(static_cast<size_t>(file_stream_.tellp()));
        } else {
            current_file_size_.store(0);
        }
    }
    
    initialized_.store(true);
    
    // 记录初始化成功（不使用递归调用）
    if (should_log(Level::INFO) && file_stream_.is_open()) {
        log_to_file(format_message(Level::INFO, 
            fmt::format("Logger initialized. Log file: {}, Mode: {}", 
                log_file_path_, (write_mode_ == WriteMode::APPEND ? "APPEND" : "TRUNCATE"))));
    }
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

bool Logger::should_log(Level level) const {
    return level != Level::OFF &&
           static_cast<int>(level) >= static_cast<int>(current_level_.load()) && 
           !shutting_down_.load();
}

void Logger::log(Level level, const std::string& message) {
    if (!should_log(level)) return;
    
    // 未显式初始化时只输出到控制台
    if (!initialized_.load()) {
        initialize("", current_level_.load(), enable_console_.load());
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;
    
    std::string formatted_message = format_message(level, message);
    
    if (enable_console_.load()) {
        log_to_console(level, formatted_message);
    }
    log_to_file(formatted_message);
    
    if (level >= Level::WARN) {
        flush();
    }
}

void Logger::log_to_console(Level level, const std::string& message) {
    std::string color_code;
    switch (level) {
        case Level::TRACE:    color_code = "\033[37m";   break; // 白色
        case Level::DEBUG:    color_code = "\033[36m";   break; // 青色
        case Level::INFO:     color_code = "\033[32m";   break; // 绿色
        case Level::WARN:     color_code = "\033[33m";   break; // 黄色
        case Level::ERROR:    color_code = "\033[31m";   break; // 红色
        case Level::CRITICAL: color_code = "\033[35m";   break; // 紫色
        default:              color_code = "\033[0m";    break;
    }
    
    std::ostream& out = (level >= Level::WARN) ? std::cerr : std::cout;
    out << color_code << message << "\033[0m" << std::endl;
}

void Logger::log_to_file(const std::string& message) {
    if (!file_stream_.is_open()) {
        return;
    }
    
    rotate_file_if_needed();
    
    file_stream_ << message << std::endl;
    current_file_size_.fetch_add(message.length() + 1); // +1 for newline
}

void Logger::rotate_file_if_needed() {
    if (current_file_size_.load() < max_file_size_) {
        return;
    }
    
    file_stream_.close();
    
    // 旋转日志文件，失败时继续写入当前文件
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

std::string Logger::level_to_string(Level level) const {
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
    // 不加锁的刷新，避免在已持有锁的情况下再次加锁
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::cout.flush();
}

void Logger::shutdown() {
    shutting_down_.store(true);
    
    // 尝试获取锁，但不要无限等待
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

} // namespace odfpack
