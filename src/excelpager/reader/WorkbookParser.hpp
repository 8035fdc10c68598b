/**
 * @file WorkbookParser.hpp
 * @brief 工作簿XML解析器（xl/workbook.xml）
 */

#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace excelpager {
namespace reader {

/**
 * @brief 工作表信息
 */
struct WorksheetInfo {
    std::string name;
    std::string sheet_id;
    std::string rel_id;
    std::string worksheet_path;   // 包内路径，如 "xl/worksheets/sheet1.xml"
    bool hidden = false;          // state="hidden" 或 "veryHidden"

    WorksheetInfo(std::string n, std::string sid, std::string rid)
        : name(std::move(n)), sheet_id(std::move(sid)), rel_id(std::move(rid)) {}
};

/**
 * @brief 工作簿XML流式解析器
 *
 * 按工作簿顺序收集 <sheet>，并读取 <workbookPr date1904>。
 */
class WorkbookParser : public BaseSAXParser {
private:
    std::vector<WorksheetInfo> worksheets_;
    std::unordered_map<std::string, std::string> relationships_;
    std::string base_dir_ = "xl/";
    bool in_sheets_section_ = false;
    bool date1904_ = false;

protected:
    void onStartElement(std::string_view name,
                        span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

public:
    /**
     * @brief 设置关系映射（从RelationshipsParser获得）
     */
    void setRelationships(std::unordered_map<std::string, std::string> relationships) {
        relationships_ = std::move(relationships);
    }

    /**
     * @brief 工作簿部件所在目录，关系目标相对于它解析（默认 "xl/"）
     */
    void setBaseDirectory(std::string base_dir) {
        base_dir_ = std::move(base_dir);
    }

    bool parse(std::string_view xml_content) {
        worksheets_.clear();
        in_sheets_section_ = false;
        date1904_ = false;
        return parseXML(xml_content);
    }

    const std::vector<WorksheetInfo>& getWorksheets() const { return worksheets_; }

    std::vector<WorksheetInfo> takeWorksheets() { return std::move(worksheets_); }

    /**
     * @brief 工作簿是否使用1904日期系统
     */
    bool isDate1904() const { return date1904_; }
};

}} // namespace excelpager::reader
