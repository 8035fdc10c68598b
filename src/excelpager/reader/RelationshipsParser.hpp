#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace excelpager {
namespace reader {

/**
 * @brief 关系文件解析器（*.rels）
 *
 * 解析时同步建立 Id 索引，findById 为 O(1)。
 */
class RelationshipsParser : public BaseSAXParser {
public:
    struct Relationship {
        std::string id;          // 如 "rId1"
        std::string type;        // 如 ".../relationships/worksheet"
        std::string target;      // 如 "worksheets/sheet1.xml"
        std::string target_mode; // 默认 "Internal"

        Relationship() : target_mode("Internal") {}
    };

    bool parse(std::string_view xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<Relationship>& getRelationships() const { return relationships_; }

    const Relationship* findById(const std::string& id) const;

    /**
     * @brief 关系 Id 到目标路径的映射（供 WorkbookParser 使用）
     */
    std::unordered_map<std::string, std::string> getTargetMap() const;

    void clear() {
        relationships_.clear();
        id_index_.clear();
    }

    /**
     * @brief 将关系目标解析为包内路径
     *
     * "/xl/worksheets/sheet1.xml" 去掉前导斜杠；相对路径拼接到 base_dir 之后并折叠 "." 与 ".."。
     * @param base_dir 关系文件所描述部件所在目录，如 "xl/"
     */
    static std::string resolvePartPath(const std::string& base_dir, const std::string& target);

private:
    std::vector<Relationship> relationships_;
    std::unordered_map<std::string, size_t> id_index_;

    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
};

}} // namespace excelpager::reader
