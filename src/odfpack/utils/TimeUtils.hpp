#pragma once

#include <ctime>
#include <cstdint>

namespace odfpack {
namespace utils {

/**
 * @brief 时间工具类 - 统一处理时间相关操作
 */
class TimeUtils {
public:
    /**
     * @brief 当前时间的 Unix 秒（与文件 mtime 的比较精度一致）
     */
    static int64_t currentUnixSeconds() {
        return static_cast<int64_t>(std::time(nullptr));
    }
};

} // namespace utils
} // namespace odfpack
