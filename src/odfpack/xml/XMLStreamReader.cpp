#include "odfpack/xml/XMLStreamReader.hpp"
#include "odfpack/utils/ModuleLoggers.hpp"
#include <cstring>
#include <stdexcept>
#include <fmt/format.h>

namespace odfpack {
namespace xml {

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();
    
    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }
    
    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    last_error_line_ = -1;
    elements_parsed_ = 0;
    attribute_pool_.clear();
    current_text_.clear();
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();
    
    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Empty XML input");
        return last_error_;
    }
    
    if (!initializeParser()) {
        return last_error_;
    }
    
    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        return last_error_;
    }
    std::memcpy(expat_buffer, buffer, size);
    
    if (XML_ParseBuffer(parser_, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        if (last_error_ == XMLParseError::Ok) {
            last_error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
            handleError(XMLParseError::ParseFailed,
                        fmt::format("Parse error at line {}, column {}: {}", 
                                    XML_GetCurrentLineNumber(parser_),
                                    XML_GetCurrentColumnNumber(parser_),
                                    XML_ErrorString(XML_GetErrorCode(parser_))));
        }
        cleanupParser();
        return last_error_;
    }
    
    cleanupParser();
    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return last_error_;
}

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    
    reader->elements_parsed_++;
    reader->current_text_.clear();
    
    reader->attribute_pool_.clear();
    for (size_t i = 0; attrs && attrs[i] && attrs[i + 1]; i += 2) {
        reader->attribute_pool_.emplace_back(std::string_view(attrs[i]), std::string_view(attrs[i + 1]));
    }
    
    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(std::string_view(name), reader->attribute_pool_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->stopWithError(XMLParseError::CallbackError, fmt::format("Start element callback error: {}", e.what()));
            return;
        }
    }
    
    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    
    reader->current_depth_--;
    
    if (!reader->current_text_.empty() && reader->text_callback_) {
        try {
            reader->text_callback_(reader->current_text_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->stopWithError(XMLParseError::CallbackError, fmt::format("Text callback error: {}", e.what()));
            return;
        }
    }
    reader->current_text_.clear();
    
    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(std::string_view(name), reader->current_depth_);
        } catch (const std::exception& e) {
            reader->stopWithError(XMLParseError::CallbackError, fmt::format("End element callback error: {}", e.what()));
        }
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_DEBUG("XML parse error: {}", message);
}

void XMLStreamReader::stopWithError(XMLParseError error, const std::string& message) {
    if (parser_) {
        last_error_line_ = static_cast<int>(XML_GetCurrentLineNumber(parser_));
        XML_StopParser(parser_, XML_FALSE);
    }
    handleError(error, message);
}

}} // namespace odfpack::xml
