#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <expat.h>
#include "excelpager/core/Constants.hpp"
#include "excelpager/core/span.hpp"

namespace excelpager {
namespace xml {

using core::span;

/**
 * @brief 流式XML解析器，基于libexpat
 *
 * - SAX解析，不构建DOM
 * - 支持分块喂数据（beginParsing/feedData/endParsing），与ZIP条目的分块解压配合
 * - 元素文本在结束标签处一次性回调
 * - 回调抛出的异常会停止解析并以 CallbackError 返回
 */

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

const char* toString(XMLParseError error) noexcept;

// XML属性（引用expat内部缓冲区，仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, span<const XMLAttribute> attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

private:
    XML_Parser parser_ = nullptr;

    bool is_parsing_ = false;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    // 属性缓存池（每个开始标签复用）
    std::vector<XMLAttribute> attribute_pool_;

    std::string current_text_;
    bool collecting_text_ = false;

    static constexpr size_t TEXT_RESERVE_SIZE = 256;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;

    bool trim_whitespace_ = true;
    bool collect_text_ = true;

    size_t bytes_parsed_ = 0;
    size_t elements_parsed_ = 0;

    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    span<const XMLAttribute> parseAttributes(const XML_Char** attrs);
    std::string_view trimStringView(std::string_view str) const;
    void handleError(XMLParseError error, const std::string& message);
    void handleCallbackError(const char* where, const std::exception& e);
    XMLParseError parseError();

public:
    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);

    /**
     * @brief 是否裁剪文本首尾空白（共享字符串等需要保留空白时关闭）
     */
    void setTrimWhitespace(bool trim);
    void setCollectText(bool collect);

    // 一次性解析
    XMLParseError parseFromString(std::string_view xml_content);

    // 流式解析
    XMLParseError beginParsing();
    XMLParseError feedData(const char* data, size_t size);
    XMLParseError endParsing();

    bool isParsing() const { return is_parsing_; }
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getBytesParsed() const { return bytes_parsed_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    int getCurrentLineNumber() const;
    int getCurrentColumnNumber() const;
};

}} // namespace excelpager::xml
