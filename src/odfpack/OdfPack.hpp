#pragma once

// OdfPack库 - OpenDocument 包（ZIP / 展开目录）读写

// 标准库依赖
#include <string>
#include <memory>

// 公共类型
#include "odfpack/core/Path.hpp"
#include "odfpack/core/Constants.hpp"
#include "odfpack/core/Exception.hpp"
#include "odfpack/package/Packaging.hpp"
#include "odfpack/package/Container.hpp"
#include "odfpack/xml/Manifest.hpp"

// 版本信息
#define ODFPACK_VERSION_MAJOR 1
#define ODFPACK_VERSION_MINOR 0
#define ODFPACK_VERSION_PATCH 0
#define ODFPACK_VERSION_STRING "1.0.0"

namespace odfpack {

inline std::string getVersion() {
    return ODFPACK_VERSION_STRING;
}

} // namespace odfpack

// 平台检测
#ifdef _WIN32
    #define ODFPACK_WINDOWS
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#elif defined(__linux__)
    #define ODFPACK_LINUX
#elif defined(__APPLE__)
    #define ODFPACK_MACOS
#endif

// 导出宏定义
#ifdef ODFPACK_WINDOWS
    #ifdef ODFPACK_SHARED
        #ifdef ODFPACK_EXPORTS
            #define ODFPACK_API __declspec(dllexport)
        #else
            #define ODFPACK_API __declspec(dllimport)
        #endif
    #else
        #define ODFPACK_API
    #endif
#else
    #define ODFPACK_API
#endif

namespace odfpack {

/**
 * @brief 初始化OdfPack库
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
ODFPACK_API bool initialize(const std::string& log_file_path = "logs/odfpack.log",
                            bool enable_console = true);

/**
 * @brief 清理OdfPack库资源
 */
ODFPACK_API void cleanup();

// === 工厂方法 ===

/**
 * @brief 打开 ODF 文件或展开目录
 * @throws core::OdfPackException 打开失败
 */
ODFPACK_API std::unique_ptr<package::Container> openDocument(const core::Path& path);

/**
 * @brief 创建空的内存容器
 */
ODFPACK_API std::unique_ptr<package::Container> createDocument();

} // namespace odfpack
