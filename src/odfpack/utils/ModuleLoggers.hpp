#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 * 
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    ODFPACK_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     ODFPACK_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     ODFPACK_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    ODFPACK_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    ODFPACK_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     ODFPACK_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     ODFPACK_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    ODFPACK_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 包模块 (package)
#define PACKAGE_DEBUG(...)    ODFPACK_LOG_DEBUG("[DBG][pkg ] " __VA_ARGS__)
#define PACKAGE_INFO(...)     ODFPACK_LOG_INFO("[INF][pkg ] " __VA_ARGS__)
#define PACKAGE_WARN(...)     ODFPACK_LOG_WARN("[WRN][pkg ] " __VA_ARGS__)
#define PACKAGE_ERROR(...)    ODFPACK_LOG_ERROR("[ERR][pkg ] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    ODFPACK_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)     ODFPACK_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)     ODFPACK_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    ODFPACK_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)    ODFPACK_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)     ODFPACK_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)    ODFPACK_LOG_ERROR("[ERR][util] " __VA_ARGS__)

// 示例模块 (examples)
#define EXAMPLE_INFO(...)     ODFPACK_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define EXAMPLE_WARN(...)     ODFPACK_LOG_WARN("[WRN][demo] " __VA_ARGS__)
#define EXAMPLE_ERROR(...)    ODFPACK_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 条件日志宏
#if ENABLE_ZIP_DEBUG_LOGS
    #define ODFPACK_LOG_ZIP_DEBUG(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define ODFPACK_LOG_ZIP_DEBUG(...) do {} while(0)
#endif

#if ENABLE_PART_CACHE_DEBUG_LOGS
    #define ODFPACK_LOG_CACHE_DEBUG(...) PACKAGE_DEBUG(__VA_ARGS__)
#else
    #define ODFPACK_LOG_CACHE_DEBUG(...) do {} while(0)
#endif
