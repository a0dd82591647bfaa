#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace odfpack {
namespace xml {

/**
 * @brief META-INF/manifest.xml 的结构化视图
 * 
 * 每个 manifest:file-entry 保留其全部属性及原始顺序，
 * 子元素（manifest:encryption-data 等）原样保存并在序列化时写回。
 */
class Manifest {
public:
    using Attributes = std::vector<std::pair<std::string, std::string>>;

    // 文件条目下的嵌套元素；只保留非空白文本
    struct Element {
        std::string name;
        Attributes attributes;
        std::string text;
        std::vector<Element> children;
    };

    struct FileEntry {
        Attributes attributes;
        std::vector<Element> children;

        std::string fullPath() const;
        std::optional<std::string> mediaType() const;
        void setAttribute(const std::string& name, const std::string& value);
    };

    /**
     * @brief 创建空清单（ODF 1.2 命名空间与版本）
     */
    Manifest();

    /**
     * @brief 解析清单XML
     * @param xml manifest.xml 的字节内容
     * @throws core::XMLException XML 格式错误或根元素不是 manifest:manifest
     */
    static Manifest parse(const std::string& xml);

    std::vector<std::string> getPaths() const;
    std::vector<std::pair<std::string, std::string>> getPathMedias() const;

    /**
     * @brief 获取某路径的媒体类型
     * @return 条目不存在或没有 media-type 属性时为空
     */
    std::optional<std::string> getMediaType(std::string_view full_path) const;

    /**
     * @brief 设置已有条目的媒体类型
     * @throws core::ParameterException 条目不存在
     */
    void setMediaType(std::string_view full_path, const std::string& media_type);

    // 条目存在时更新其媒体类型，否则追加新条目
    void addFullPath(const std::string& full_path, const std::string& media_type = "");

    /**
     * @brief 删除条目
     * @throws core::ParameterException 条目不存在
     */
    void delFullPath(std::string_view full_path);

    bool hasPath(std::string_view full_path) const;
    size_t size() const { return entries_.size(); }
    const std::vector<FileEntry>& entries() const { return entries_; }

    std::string serialize() const;

private:
    Attributes root_attributes_;
    std::vector<FileEntry> entries_;

    std::vector<FileEntry>::iterator findEntry(std::string_view full_path);
    std::vector<FileEntry>::const_iterator findEntry(std::string_view full_path) const;
};

}} // namespace odfpack::xml
