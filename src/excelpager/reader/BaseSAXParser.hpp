#pragma once

#include "excelpager/xml/XMLStreamReader.hpp"
#include "excelpager/archive/ZipReader.hpp"
#include "excelpager/core/CancellationToken.hpp"
#include "excelpager/core/span.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace excelpager {
namespace reader {

using core::span;

/**
 * @brief 通用SAX解析器基类 - 为所有部件解析器提供统一的SAX解析能力
 *
 * - 基于XMLStreamReader的事件驱动
 * - 一次性解析（parseXML）与ZIP条目流式解析（parseStream）共用同一组处理器
 * - 元素栈和文本收集状态跟踪
 * - 错误以 hasError()/getErrorMessage() 报告，由调用方转换为 core::Error
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;
        int current_depth = 0;
        std::string current_text;
        bool collecting_text = false;
        bool has_error = false;
        bool cancelled = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            current_text.clear();
            collecting_text = false;
            has_error = false;
            cancelled = false;
            error_message.clear();
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析完整的XML内容
     * @return 是否解析成功
     */
    bool parseXML(std::string_view xml_content);

    /**
     * @brief 从ZIP条目分块解压并解析
     * @param stream 已打开的条目流
     * @param token 取消令牌，每个数据块轮询一次，可为空
     * @return 是否解析成功（取消时返回 false 且 wasCancelled() 为 true）
     */
    bool parseStream(archive::EntryStream& stream, const core::CancellationToken* token = nullptr);

    bool hasError() const { return state_.has_error; }
    bool wasCancelled() const { return state_.cancelled; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    /**
     * @brief 将 reader 的回调绑定到本对象的处理器
     */
    void bindCallbacks(xml::XMLStreamReader& reader);

    /**
     * @brief 文本是否保留首尾空白（共享字符串与内联字符串需要保留）
     */
    virtual bool preserveWhitespace() const { return false; }

    /**
     * @brief 已得到全部所需数据时返回 true，parseStream 随即停止读取
     */
    virtual bool isComplete() const { return false; }

    // 子类重写的SAX事件处理器
    virtual void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 通用工具方法 ====================

    static std::optional<std::string_view> findAttribute(span<const xml::XMLAttribute> attributes,
                                                         std::string_view name) {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return attr.value;
            }
        }
        return std::nullopt;
    }

    static std::optional<int64_t> findIntAttribute(span<const xml::XMLAttribute> attributes,
                                                   std::string_view name);

    static std::string getAttributeOr(span<const xml::XMLAttribute> attributes,
                                      std::string_view name, std::string_view default_value) {
        auto val = findAttribute(attributes, name);
        return std::string(val ? *val : default_value);
    }

    static bool getBoolAttributeOr(span<const xml::XMLAttribute> attributes,
                                   std::string_view name, bool default_value) {
        auto val = findAttribute(attributes, name);
        if (!val) {
            return default_value;
        }
        return *val == "1" || *val == "true" || *val == "True" || *val == "TRUE";
    }

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    const std::string& getCurrentText() const {
        return state_.current_text;
    }

    void setError(const std::string& message);

    bool isInElement(std::string_view element_name) const;

private:
    void handleStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth);
    void handleEndElement(std::string_view name, int depth);
    void handleText(std::string_view text, int depth);
    bool finish(xml::XMLParseError result, const xml::XMLStreamReader& reader);
};

}} // namespace excelpager::reader
