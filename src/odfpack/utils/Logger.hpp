#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <iostream>
#include <mutex>
#include <chrono>
#include <atomic>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <cstring>
#include <algorithm>

#ifdef ERROR
#undef ERROR
#endif

namespace odfpack {

/**
 * @brief 全局日志器
 *
 * 控制台输出中 WARN 及以上级别写入 std::cerr，其余写入 std::cout，
 * 以便诊断信息与正常输出区分开。
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
     */
    void initialize(const std::string& log_file_path = "logs/odfpack.log", 
                   Level level = Level::INFO, 
                   bool enable_console = true,
                   size_t max_file_size = 10 * 1024 * 1024,
                   size_t max_files = 5,
                   WriteMode write_mode = WriteMode::TRUNCATE);
    
    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }
    
    void log(Level level, const std::string& message);

    template<typename... Args>
    inline void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        std::string message;
        try {
            message = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            message = fmt_str;
        }
        log(level, message);
    }
    
    void flush();
    void shutdown();

    // 带源码位置信息的接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        const std::string fmt_with_ctx = fmt::format("[{}:{}:{}] {}", baseFilename(file), line, extractFunctionName(func), fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    std::string level_to_string(Level level) const;
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
    
    // 提取函数名（去除命名空间和参数）
    static inline std::string extractFunctionName(const char* func_sig) {
        if (!func_sig) return "";
        
        std::string sig(func_sig);
        size_t lastColon = sig.rfind("::");
        if (lastColon != std::string::npos) {
            sig = sig.substr(lastColon + 2);
        }
        size_t paren = sig.find('(');
        if (paren != std::string::npos) {
            sig = sig.substr(0, paren);
        }
        return sig;
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
#  define ODFPACK_FUNC __FUNCTION__
#else
#  define ODFPACK_FUNC __func__
#endif

// 统一日志宏（带源码位置信息，不包含模块前缀）
#define ODFPACK_LOG_TRACE(fmt, ...)    odfpack::Logger::getInstance().logCtx(odfpack::Logger::Level::TRACE,    __FILE__, __LINE__, ODFPACK_FUNC, fmt, ##__VA_ARGS__)
#define ODFPACK_LOG_DEBUG(fmt, ...)    odfpack::Logger::getInstance().logCtx(odfpack::Logger::Level::DEBUG,    __FILE__, __LINE__, ODFPACK_FUNC, fmt, ##__VA_ARGS__)
#define ODFPACK_LOG_INFO(fmt, ...)     odfpack::Logger::getInstance().logCtx(odfpack::Logger::Level::INFO,     __FILE__, __LINE__, ODFPACK_FUNC, fmt, ##__VA_ARGS__)
#define ODFPACK_LOG_WARN(fmt, ...)     odfpack::Logger::getInstance().logCtx(odfpack::Logger::Level::WARN,     __FILE__, __LINE__, ODFPACK_FUNC, fmt, ##__VA_ARGS__)
#define ODFPACK_LOG_ERROR(fmt, ...)    odfpack::Logger::getInstance().logCtx(odfpack::Logger::Level::ERROR,    __FILE__, __LINE__, ODFPACK_FUNC, fmt, ##__VA_ARGS__)
#define ODFPACK_LOG_CRITICAL(fmt, ...) odfpack::Logger::getInstance().logCtx(odfpack::Logger::Level::CRITICAL, __FILE__, __LINE__, ODFPACK_FUNC, fmt, ##__VA_ARGS__)

} // namespace odfpack
