#pragma once

#include <string>

namespace odfpack {
namespace package {

/**
 * @brief 打包方式
 */
enum class Packaging {
    Zip,
    Folder
};

const char* toString(Packaging packaging) noexcept;

/**
 * @brief 解析打包方式字符串（去除首尾空白、不区分大小写）
 * @throws core::ParameterException 不是 "zip" 或 "folder" 时
 */
Packaging parsePackaging(const std::string& value);

}} // namespace odfpack::package
