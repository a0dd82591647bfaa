/**
 * @file XMLStreamWriter.hpp
 * @brief 内存缓冲的XML流写入器
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <stack>
#include <utility>

namespace odfpack {
namespace xml {

/**
 * @brief 内存模式的XML流写入器
 * 
 * 属性先进入待写队列，在元素开始标签闭合时一次性输出；
 * 没有子内容的元素输出为自闭合形式 " />"。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter() = default;
    ~XMLStreamWriter() = default;
    
    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;
    
    // 文档操作
    void startDocument(const std::string& encoding = "UTF-8");
    void endDocument();
    
    // 元素操作
    void startElement(const std::string& name);
    void endElement();
    void writeEmptyElement(const std::string& name);
    
    // 属性操作
    void writeAttribute(const std::string& name, std::string_view value);
    
    // 文本操作
    void writeText(std::string_view text);
    
    /**
     * @brief 获取已生成的XML
     * @return 缓冲区内容（未闭合的开始标签会先被闭合）
     */
    const std::string& toString();
    
    void clear();
    
    size_t getDepth() const { return element_stack_.size(); }

private:
    std::string buffer_;
    std::stack<std::string> element_stack_;
    bool in_element_ = false;
    std::vector<std::pair<std::string, std::string>> pending_attributes_;
    
    void ensureElementClosed();
    void writeAttributesToBuffer();
    void writeEscapedAttribute(std::string_view text);
    void writeEscapedText(std::string_view text);
};

}} // namespace odfpack::xml
