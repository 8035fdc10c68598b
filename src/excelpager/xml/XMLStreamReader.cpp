#include "excelpager/xml/XMLStreamReader.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <cstring>
#include <fmt/format.h>

namespace excelpager {
namespace xml {

const char* toString(XMLParseError error) noexcept {
    switch (error) {
        case XMLParseError::Ok: return "Ok";
        case XMLParseError::InvalidInput: return "InvalidInput";
        case XMLParseError::ParserCreateFailed: return "ParserCreateFailed";
        case XMLParseError::ParseFailed: return "ParseFailed";
        case XMLParseError::MemoryError: return "MemoryError";
        case XMLParseError::CallbackError: return "CallbackError";
        default: return "Unknown";
    }
}

XMLStreamReader::XMLStreamReader() {
    attribute_pool_.reserve(32);
    current_text_.reserve(TEXT_RESERVE_SIZE);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate(nullptr);
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
    is_parsing_ = false;
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attribute_pool_.clear();
    current_text_.clear();
    collecting_text_ = false;
    bytes_parsed_ = 0;
    elements_parsed_ = 0;
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setTrimWhitespace(bool trim) {
    trim_whitespace_ = trim;
}

void XMLStreamReader::setCollectText(bool collect) {
    collect_text_ = collect;
}

XMLParseError XMLStreamReader::parseFromString(std::string_view xml_content) {
    if (xml_content.empty()) {
        handleError(XMLParseError::InvalidInput, "Empty XML content");
        return XMLParseError::InvalidInput;
    }

    XMLParseError result = beginParsing();
    if (isError(result)) {
        return result;
    }
    result = feedData(xml_content.data(), xml_content.size());
    if (isError(result)) {
        is_parsing_ = false;
        return result;
    }
    return endParsing();
}

XMLParseError XMLStreamReader::beginParsing() {
    resetState();
    if (!initializeParser()) {
        return last_error_;
    }
    is_parsing_ = true;
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::feedData(const char* data, size_t size) {
    if (!parser_ || !is_parsing_) {
        handleError(XMLParseError::ParserCreateFailed, "Parser not initialized");
        return XMLParseError::ParserCreateFailed;
    }
    if (!data || size == 0) {
        return XMLParseError::Ok;
    }

    bytes_parsed_ += size;

    // 使用ParseBuffer API，直接写入Expat内部缓冲区
    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        return XMLParseError::MemoryError;
    }
    std::memcpy(expat_buffer, data, size);

    if (XML_ParseBuffer(parser_, static_cast<int>(size), 0) == XML_STATUS_ERROR) {
        return parseError();
    }
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::endParsing() {
    if (!parser_ || !is_parsing_) {
        handleError(XMLParseError::ParserCreateFailed, "Parser not initialized");
        return XMLParseError::ParserCreateFailed;
    }

    is_parsing_ = false;
    if (XML_ParseBuffer(parser_, 0, 1) == XML_STATUS_ERROR) {
        return parseError();
    }

    XML_DEBUG("Parsed {} bytes, {} elements", bytes_parsed_, elements_parsed_);
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::parseError() {
    is_parsing_ = false;
    // 回调错误时解析器被主动停止，保留回调记录的错误信息
    if (last_error_ == XMLParseError::CallbackError) {
        return last_error_;
    }
    handleError(XMLParseError::ParseFailed,
                fmt::format("Parse error at line {}, column {}: {}",
                            XML_GetCurrentLineNumber(parser_),
                            XML_GetCurrentColumnNumber(parser_),
                            XML_ErrorString(XML_GetErrorCode(parser_))));
    return XMLParseError::ParseFailed;
}

int XMLStreamReader::getCurrentLineNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
}

int XMLStreamReader::getCurrentColumnNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
}

// libexpat回调函数实现
void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;

    auto attributes = reader->parseAttributes(attrs);

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, attributes, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleCallbackError("Start element", e);
            return;
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
    reader->collecting_text_ = reader->collect_text_;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    if (reader->collecting_text_ && !reader->current_text_.empty()) {
        std::string_view text_content = reader->trim_whitespace_ ?
            reader->trimStringView(reader->current_text_) : std::string_view{reader->current_text_};

        if (!text_content.empty() && reader->text_callback_) {
            try {
                reader->text_callback_(text_content, reader->current_depth_);
            } catch (const std::exception& e) {
                reader->handleCallbackError("Text", e);
                return;
            }
        }
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->handleCallbackError("End element", e);
            return;
        }
    }

    reader->current_text_.clear();
    reader->collecting_text_ = reader->collect_text_;
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    if (reader->collecting_text_ && len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

span<const XMLAttribute> XMLStreamReader::parseAttributes(const XML_Char** attrs) {
    attribute_pool_.clear();

    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                attribute_pool_.emplace_back(
                    std::string_view{attrs[i], std::strlen(attrs[i])},
                    std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])}
                );
            }
        }
    }

    return span<const XMLAttribute>{attribute_pool_.data(), attribute_pool_.size()};
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) const {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }

    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_ERROR("XML parse error: {}", message);
}

void XMLStreamReader::handleCallbackError(const char* where, const std::exception& e) {
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", where, e.what()));
    if (parser_) {
        XML_StopParser(parser_, XML_FALSE);
    }
}

}} // namespace excelpager::xml
