#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <expat.h>

namespace odfpack {
namespace xml {

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML属性（引用 expat 缓冲区，只在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;
    
    XMLAttribute(std::string_view n, std::string_view v) 
        : name(n), value(v) {}
};

/**
 * @brief 基于 libexpat 的 SAX 解析器
 *
 * 元素名保持文档中的限定名（如 "manifest:file-entry"），不做命名空间展开。
 */
class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

    XMLStreamReader() = default;
    ~XMLStreamReader();
    
    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;
    
    void setStartElementCallback(StartElementCallback callback) { start_element_callback_ = std::move(callback); }
    void setEndElementCallback(EndElementCallback callback) { end_element_callback_ = std::move(callback); }
    void setTextCallback(TextCallback callback) { text_callback_ = std::move(callback); }
    
    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);
    
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getLastErrorLine() const { return last_error_line_; }
    size_t getElementsParsed() const { return elements_parsed_; }

private:
    XML_Parser parser_ = nullptr;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;
    int last_error_line_ = -1;
    size_t elements_parsed_ = 0;
    
    std::vector<XMLAttribute> attribute_pool_;
    std::string current_text_;
    
    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);
    
    bool initializeParser();
    void cleanupParser();
    void resetState();
    void handleError(XMLParseError error, const std::string& message);
    void stopWithError(XMLParseError error, const std::string& message);
};

}} // namespace odfpack::xml
