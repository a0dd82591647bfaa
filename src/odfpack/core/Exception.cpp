/**
 * @file Exception.cpp
 * @brief OdfPack异常类实现
 */

#include "Exception.hpp"
#include "odfpack/utils/ModuleLoggers.hpp"
#include <sstream>
#include <fmt/format.h>
#include <iostream>
#include <mutex>

namespace odfpack {
namespace core {

OdfPackException::OdfPackException(const std::string& message, 
                                   ErrorCode code,
                                   const char* file,
                                   int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string OdfPackException::getErrorCodeString() const {
    return toName(error_code_);
}

std::string OdfPackException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();
    
    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }
    
    return oss.str();
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : OdfPackException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

FormatException::FormatException(const std::string& message,
                                 ErrorCode code, const char* file, int line)
    : OdfPackException(message, code, file, line) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       ErrorCode code, const char* file, int line)
    : OdfPackException(parameter_name.empty() ? message
                           : fmt::format("{} (parameter: {})", message, parameter_name),
                       code, file, line)
    , parameter_name_(parameter_name) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : OdfPackException(operation.empty() ? message
                           : fmt::format("{} (operation: {})", message, operation),
                       code, file, line)
    , operation_(operation) {
}

PartException::PartException(const std::string& message,
                             const std::string& part_name,
                             ErrorCode code, const char* file, int line)
    : OdfPackException(fmt::format("{} (part: {})", message, part_name), code, file, line)
    , part_name_(part_name) {
}

XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           int xml_line, const char* file, int line)
    : OdfPackException(xml_line > 0 ? fmt::format("{} (line {})", message, xml_line) : message,
                       ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path)
    , xml_line_(xml_line) {
}

void StderrWarningHandler::handleWarning(const std::string& message,
                                         const std::string& context) {
    std::cerr << "OdfPack Warning: " << message;
    if (!context.empty()) {
        std::cerr << " (context: " << context << ")";
    }
    std::cerr << '\n';
}

ErrorManager::ErrorManager()
    : warning_handler_(std::make_unique<StderrWarningHandler>()) {
}

ErrorManager& ErrorManager::getInstance() {
    static ErrorManager instance;
    return instance;
}

void ErrorManager::setWarningHandler(std::unique_ptr<WarningHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    warning_handler_ = std::move(handler);
}

void ErrorManager::handleWarning(const std::string& message, const std::string& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    stats_.total_warnings++;
    CORE_DEBUG("warning [{}]: {}", context, message);
    
    if (warning_handler_) {
        warning_handler_->handleWarning(message, context);
    }
}

ErrorManager::ErrorStatistics ErrorManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void ErrorManager::resetStatistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = {};
}

} // namespace core
} // namespace odfpack
