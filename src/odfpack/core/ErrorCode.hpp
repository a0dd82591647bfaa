#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace odfpack {
namespace core {

/**
 * @brief OdfPack统一错误码
 *
 * 按区间分组：通用、文件、包格式、部件、ZIP/XML。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,
    
    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 2,
    
    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileCorrupted = 22,
    FileWriteError = 23,
    FileReadError = 24,
    
    // 包格式错误 (40-59)
    InvalidFormat = 40,
    UnknownMimetype = 41,
    MissingMimetype = 42,
    UnsupportedPackaging = 43,
    UnsupportedSource = 44,
    UnsupportedTarget = 45,
    
    // 部件错误 (60-69)
    PartDeleted = 60,
    ManifestEntryNotFound = 61,
    InvalidPartPath = 62,
    
    // ZIP/XML处理错误 (70-89)
    ZipError = 70,
    XmlParseError = 71,
    XmlInvalidFormat = 72
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息
    
    Error() : code(ErrorCode::Ok) {}
    
    explicit Error(ErrorCode c);
    
    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}
    
    Error(ErrorCode c, const std::string& msg, const std::string& ctx) 
        : code(c), message(msg), context(ctx) {}
    
    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }
    
    explicit operator bool() const noexcept { return isError(); }
    
    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转可读字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误码转枚举名
 */
const char* toName(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace odfpack::core
