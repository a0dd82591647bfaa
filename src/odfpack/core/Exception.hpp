/**
 * @file Exception.hpp
 * @brief OdfPack异常类定义
 */

#ifndef ODFPACK_EXCEPTION_HPP
#define ODFPACK_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <memory>
#include <mutex>
#include "ErrorCode.hpp"

namespace odfpack {
namespace core {

/**
 * @brief OdfPack基础异常类
 */
class OdfPackException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    OdfPackException(const std::string& message, 
                     ErrorCode code = ErrorCode::InternalError,
                     const char* file = nullptr,
                     int line = 0);
    
    ErrorCode getErrorCode() const noexcept { return error_code_; }
    
    std::string getErrorCodeString() const;
    
    /**
     * @brief 获取详细错误信息（错误码、位置和上下文）
     */
    std::string getDetailedMessage() const;
    
    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
};

/**
 * @brief 文件相关异常（源文件不存在、读写失败）
 */
class FileException : public OdfPackException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);
    
    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 格式相关异常（未知 mimetype、缺少 mimetype）
 */
class FormatException : public OdfPackException {
public:
    FormatException(const std::string& message,
                    ErrorCode code = ErrorCode::InvalidFormat,
                    const char* file = nullptr, int line = 0);
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public OdfPackException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);
    
    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常（不支持的源或目标类型）
 */
class OperationException : public OdfPackException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);
    
    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief 部件相关异常
 *
 * 读取已删除的部件时抛出；只影响本次读取，容器仍可继续使用。
 */
class PartException : public OdfPackException {
public:
    PartException(const std::string& message,
                  const std::string& part_name,
                  ErrorCode code = ErrorCode::PartDeleted,
                  const char* file = nullptr, int line = 0);
    
    const std::string& getPartName() const { return part_name_; }

private:
    std::string part_name_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public OdfPackException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 int xml_line = -1,
                 const char* file = nullptr, int line = 0);
    
    const std::string& getXMLPath() const { return xml_path_; }
    int getXMLLine() const { return xml_line_; }

private:
    std::string xml_path_;
    int xml_line_;
};

/**
 * @brief 非致命警告的接收者
 *
 * 容器在可恢复的情况下（缺少标准部件、ZIP 单个部件读取失败、
 * 文件夹缺少 mimetype 等）不抛异常，而是通过它报告。
 */
class WarningHandler {
public:
    virtual ~WarningHandler() = default;
    virtual void handleWarning(const std::string& message, const std::string& context) = 0;
};

/**
 * @brief 默认处理器，警告写入 std::cerr
 */
class StderrWarningHandler : public WarningHandler {
public:
    void handleWarning(const std::string& message, const std::string& context) override;
};

/**
 * @brief 警告分发与计数
 */
class ErrorManager {
public:
    static ErrorManager& getInstance();
    
    /// 传入 nullptr 时只记录日志与计数
    void setWarningHandler(std::unique_ptr<WarningHandler> handler);
    
    void handleWarning(const std::string& message, const std::string& context = "");
    
    struct ErrorStatistics {
        size_t total_warnings = 0;
    };
    
    ErrorStatistics getStatistics() const;
    void resetStatistics();

private:
    ErrorManager();
    ~ErrorManager() = default;
    
    std::unique_ptr<WarningHandler> warning_handler_;
    mutable std::mutex mutex_;
    ErrorStatistics stats_;
    
    ErrorManager(const ErrorManager&) = delete;
    ErrorManager& operator=(const ErrorManager&) = delete;
};

} // namespace core
} // namespace odfpack

// 便捷宏定义：参数按异常构造函数顺序给出，自动追加源码位置
#define ODFPACK_THROW(ExceptionType, ...) \
    throw ExceptionType(__VA_ARGS__, __FILE__, __LINE__)

#define ODFPACK_THROW_IF(condition, ExceptionType, ...) \
    do { if (condition) { ODFPACK_THROW(ExceptionType, __VA_ARGS__); } } while(0)

#define ODFPACK_HANDLE_WARNING(message, context) \
    odfpack::core::ErrorManager::getInstance().handleWarning(message, context)

#endif // ODFPACK_EXCEPTION_HPP
