#pragma once

#include "BaseSAXParser.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace excelpager {
namespace reader {

/**
 * @brief 共享字符串表解析器（xl/sharedStrings.xml）
 *
 * 支持两种模式：
 * - 完整模式：保存全部字符串
 * - 选择模式（setWantedIndices）：只保存一页实际引用到的索引，
 *   全部找到后提前结束，内存与页大小而不是共享字符串表大小成正比
 *
 * 富文本 <r><t> 按顺序拼接，注音 <rPh> 中的文本忽略，空白原样保留。
 */
class SharedStringsParser : public BaseSAXParser {
public:
    bool parse(std::string_view xml_content) {
        clear();
        return parseXML(xml_content);
    }

    /**
     * @brief 只收集指定索引（空集合表示恢复完整模式）
     */
    void setWantedIndices(std::unordered_set<uint32_t> indices) {
        wanted_ = std::move(indices);
        selective_ = !wanted_.empty();
    }

    /**
     * @brief 根据索引获取字符串
     * @return 索引不存在（或未被收集）时返回 nullptr
     */
    const std::string* getString(uint32_t index) const;

    /**
     * @brief 已解析的 <si> 数量（选择模式下提前结束时小于表的实际大小）
     */
    uint32_t getParsedCount() const { return next_index_; }

    size_t getStoredCount() const { return strings_.size(); }

    void clear() {
        strings_.clear();
        next_index_ = 0;
        in_si_ = false;
        in_phonetic_ = false;
        current_.clear();
    }

protected:
    bool preserveWhitespace() const override { return true; }
    bool isComplete() const override { return selective_ && strings_.size() == wanted_.size(); }

private:
    std::unordered_map<uint32_t, std::string> strings_;
    std::unordered_set<uint32_t> wanted_;
    bool selective_ = false;

    uint32_t next_index_ = 0;
    bool in_si_ = false;
    bool in_phonetic_ = false;
    std::string current_;

    bool wantsCurrent() const { return !selective_ || wanted_.count(next_index_) > 0; }

    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
};

}} // namespace excelpager::reader
