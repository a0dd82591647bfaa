#pragma once

#include "odfpack/archive/ZipWriter.hpp"
#include <string>
#include <vector>

namespace odfpack {
namespace package {

class PartStore;

/**
 * @brief ODF ZIP 输出顺序
 *
 * mimetype 第一个且不压缩；随后 content、meta、settings、styles；
 * 然后是其余部件；META-INF/manifest.xml 最后。已删除的部件不写出。
 */
class ZipLayout {
public:
    struct Entry {
        std::string name;
        archive::ZipWriter::Method method;
    };
    
    /**
     * @brief 计算写出顺序
     *
     * 缺少标准 XML 部件或清单时发出警告（不中断）。
     * @throws core::FormatException mimetype 不存在或已删除时
     */
    static std::vector<Entry> plan(const PartStore& store);
    
    /**
     * @brief 按 plan() 给出的顺序把部件写入已打开的 writer
     * @throws core::FileException 写入失败时
     */
    static void write(const PartStore& store, const std::vector<Entry>& entries,
                      archive::ZipWriter& writer);
};

}} // namespace odfpack::package
