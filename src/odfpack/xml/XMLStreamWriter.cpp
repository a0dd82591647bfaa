#include "odfpack/xml/XMLStreamWriter.hpp"
#include "odfpack/xml/XMLEscapes.hpp"
#include "odfpack/core/Exception.hpp"
#include "odfpack/utils/Logger.hpp"

namespace odfpack {
namespace xml {

void XMLStreamWriter::startDocument(const std::string& encoding) {
    buffer_.append("<?xml version=\"1.0\" encoding=\"");
    buffer_.append(encoding);
    buffer_.append("\"?>\n");
    
    ODFPACK_LOG_TRACE("Started XML document with encoding: {}", encoding);
}

void XMLStreamWriter::endDocument() {
    // 确保所有元素都已关闭
    while (!element_stack_.empty()) {
        ODFPACK_LOG_WARN("Auto-closing unclosed element: {}", element_stack_.top());
        endElement();
    }
    
    ODFPACK_LOG_TRACE("Ended XML document, {} bytes", buffer_.size());
}

void XMLStreamWriter::startElement(const std::string& name) {
    ODFPACK_THROW_IF(name.empty(), core::ParameterException, "Element name cannot be empty",
                     "name", core::ErrorCode::InvalidArgument);
    
    ensureElementClosed();
    
    buffer_.push_back('<');
    buffer_.append(name);
    
    element_stack_.push(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        ODFPACK_THROW(core::OperationException, "No element to close", "endElement",
                      core::ErrorCode::InvalidArgument);
    }
    
    std::string element_name = std::move(element_stack_.top());
    element_stack_.pop();
    
    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        buffer_.append(" />");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_name);
        buffer_.push_back('>');
    }
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    ODFPACK_THROW_IF(name.empty(), core::ParameterException, "Element name cannot be empty",
                     "name", core::ErrorCode::InvalidArgument);
    
    ensureElementClosed();
    
    buffer_.push_back('<');
    buffer_.append(name);
    writeAttributesToBuffer();
    buffer_.append(" />");
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    if (!in_element_) {
        ODFPACK_THROW(core::OperationException, "Cannot write attribute outside of element",
                      "writeAttribute", core::ErrorCode::InvalidArgument);
    }
    ODFPACK_THROW_IF(name.empty(), core::ParameterException, "Attribute name cannot be empty",
                     "name", core::ErrorCode::InvalidArgument);
    pending_attributes_.emplace_back(name, std::string(value));
}

void XMLStreamWriter::writeText(std::string_view text) {
    if (text.empty()) {
        return;
    }
    ensureElementClosed();
    writeEscapedText(text);
}

const std::string& XMLStreamWriter::toString() {
    ensureElementClosed();
    return buffer_;
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    while (!element_stack_.empty()) {
        element_stack_.pop();
    }
    in_element_ = false;
    pending_attributes_.clear();
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(attr.first);
        buffer_.append("=\"");
        writeEscapedAttribute(attr.second);
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

void XMLStreamWriter::writeEscapedAttribute(std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '&':  buffer_.append(XMLEscapes::AMP); break;
            case '<':  buffer_.append(XMLEscapes::LT); break;
            case '>':  buffer_.append(XMLEscapes::GT); break;
            case '"':  buffer_.append(XMLEscapes::QUOT); break;
            case '\n': buffer_.append(XMLEscapes::NL); break;
            case '\t': buffer_.append(XMLEscapes::TAB); break;
            default:   buffer_.push_back(c); break;
        }
    }
}

void XMLStreamWriter::writeEscapedText(std::string_view text) {
    for (char c : text) {
        switch (c) {
            case '&': buffer_.append(XMLEscapes::AMP); break;
            case '<': buffer_.append(XMLEscapes::LT); break;
            case '>': buffer_.append(XMLEscapes::GT); break;
            default:  buffer_.push_back(c); break;
        }
    }
}

}} // namespace odfpack::xml
