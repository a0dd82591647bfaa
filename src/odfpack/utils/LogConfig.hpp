#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用

#define ENABLE_ZIP_DEBUG_LOGS 0      // ZIP 条目级别的调试日志
#define ENABLE_PART_CACHE_DEBUG_LOGS 0 // 部件缓存命中/失效的调试日志

// 条件日志宏在 ModuleLoggers.hpp 中定义：
// ODFPACK_LOG_ZIP_DEBUG   -> ARCHIVE_DEBUG
// ODFPACK_LOG_CACHE_DEBUG -> PACKAGE_DEBUG
