#pragma once

#include "odfpack/core/Path.hpp"
#include "odfpack/package/IPartBackend.hpp"
#include "odfpack/package/Packaging.hpp"
#include "odfpack/package/PartStore.hpp"
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace odfpack {
namespace package {

/**
 * @brief 保存选项（即 Container::SaveOptions）
 */
struct ContainerSaveOptions {
    std::string packaging;   // "zip" / "folder"，为空时沿用当前打包方式
    bool backup = false;     // 目标已存在时先移到 <stem>.backup<suffix>
};

/**
 * @brief ODF 文档容器
 * 
 * 把一个 OpenDocument 文件视为按路径命名的部件集合。部件按需从
 * ZIP 归档或展开目录中读取并缓存，可修改、删除，再保存为任一种打包方式。
 * 
 * 缓存规则：
 * - ZIP：打开后视为不可变，已缓存的部件直接返回
 * - 文件夹：比较文件 mtime（秒），变化时重新读取
 * - 调用方通过 setPart() 写入的内容始终优先
 * - 已删除的部件再次读取会抛出 PartException
 * 
 * 非线程安全，一个实例只能在一个线程中使用。
 */
class Container {
public:
    /**
     * @brief 保存选项
     */
    using SaveOptions = ContainerSaveOptions;

    /**
     * @brief 创建空的内存容器（ZIP 打包，无源路径）
     */
    Container() = default;
    
    /**
     * @brief 打开文件或目录
     * @throws 同 open(const core::Path&)
     */
    explicit Container(const core::Path& path);
    
    /**
     * @brief 从二进制流打开（全部部件立即读入内存）
     * @throws 同 open(std::istream&)
     */
    explicit Container(std::istream& stream);
    
    ~Container();
    
    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;
    Container(Container&&) noexcept;
    Container& operator=(Container&&) noexcept;
    
    /**
     * @brief 打开 ODF 文件或展开目录
     * @param path 文件或目录路径
     * @throws core::FileException 路径不存在，或 ZIP 归档损坏
     * @throws core::OperationException 既不是 ZIP 也不是目录
     * @throws core::FormatException mimetype 不是已知的 ODF 类型
     */
    void open(const core::Path& path);
    
    /**
     * @brief 从二进制流打开；流在检测后回到原位置，打开后不再保留
     * @throws core::OperationException 流不可定位或不是 ZIP
     * @throws core::FileException ZIP 内容损坏
     * @throws core::FormatException mimetype 不是已知的 ODF 类型
     */
    void open(std::istream& stream);
    
    /**
     * @brief 读取部件
     * @param path 部件路径
     * @return 部件内容；未跟踪的部件返回 std::nullopt
     * @throws core::PartException 部件已被删除
     */
    std::optional<std::string> getPart(const std::string& path);
    
    /**
     * @brief 写入部件（只修改内存，不触及磁盘）
     * @throws core::ParameterException 路径为空或含 ".." 段
     */
    void setPart(const std::string& path, std::string data);
    
    /**
     * @brief 删除部件，之后的 getPart() 会抛出异常
     */
    void delPart(const std::string& path);
    
    /**
     * @brief 列出部件
     * 
     * 没有绑定路径时返回内存中的所有键；否则每次从后端重新列举。
     */
    std::vector<std::string> getParts() const;
    
    /**
     * @brief 文档 mimetype，部件缺失时返回空串
     * @throws core::PartException mimetype 部件已被删除
     */
    std::string mimetype();
    void setMimetype(const std::string& mimetype);
    
    /**
     * @brief 保存到打开时的路径
     * @throws core::ParameterException 没有绑定路径或打包方式无效
     */
    void save(const SaveOptions& options = SaveOptions());
    
    /**
     * @brief 保存到指定路径
     * 
     * 末尾的路径分隔符与 ".folder" 后缀会被去掉；文件夹打包时再加回 ".folder"。
     * @throws core::ParameterException 打包方式无效
     * @throws core::FormatException ZIP 打包时缺少 mimetype
     * @throws core::FileException 写入失败
     */
    void save(const core::Path& target, const SaveOptions& options = SaveOptions());
    
    /**
     * @brief 以 ZIP 格式写入流
     * @throws core::OperationException 请求文件夹打包
     */
    void save(std::ostream& stream, const SaveOptions& options = SaveOptions());
    
    /**
     * @brief 深拷贝：读入全部部件，副本不绑定任何路径
     */
    std::unique_ptr<Container> clone();
    
    /**
     * @brief 以模板创建新文档
     * 
     * 打开模板（.ott、.ots 等）并克隆，mimetype 去掉 "-template"，
     * 同步更新清单中根条目 "/" 的媒体类型。
     */
    static std::unique_ptr<Container> fromTemplate(const core::Path& template_path);
    
    /**
     * @brief 默认的 manifest.rdf 内容
     */
    static std::string defaultManifestRdf();
    
    const core::Path& path() const { return path_; }
    Packaging packaging() const { return packaging_; }
    bool isPathBound() const { return backend_ != nullptr; }
    
    std::string toString();

private:
    PartStore store_;
    std::unique_ptr<IPartBackend> backend_;
    core::Path path_;
    Packaging packaging_ = Packaging::Zip;
    
    void reset();
    void validateMimetype();
    void openFolder();
    void materialize();
    
    Packaging resolvePackaging(const std::string& requested) const;
    void saveToPath(const core::Path& target, Packaging packaging, bool backup);
    
    static core::Path cleanTarget(const core::Path& target);
    static void backupTarget(const core::Path& target);
};

}} // namespace odfpack::package
