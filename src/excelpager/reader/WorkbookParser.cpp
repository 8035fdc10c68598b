/**
 * @file WorkbookParser.cpp
 * @brief 工作簿XML解析器实现
 */

#include "excelpager/reader/WorkbookParser.hpp"
#include "excelpager/reader/RelationshipsParser.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"

namespace excelpager {
namespace reader {

namespace {

// r:id 的命名空间前缀不固定，按后缀匹配
bool isRelationshipIdAttribute(std::string_view name) {
    if (name == "r:id") {
        return true;
    }
    size_t colon = name.find(':');
    return colon != std::string_view::npos && name.substr(colon) == ":id";
}

} // namespace

void WorkbookParser::onStartElement(std::string_view name,
                                    span<const xml::XMLAttribute> attributes, int /* depth */) {
    if (name == "workbookPr") {
        date1904_ = getBoolAttributeOr(attributes, "date1904", false);
    } else if (name == "sheets") {
        in_sheets_section_ = true;
    } else if (name == "sheet" && in_sheets_section_) {
        std::string sheet_name;
        std::string sheet_id;
        std::string rel_id;
        std::string state;

        for (const auto& attr : attributes) {
            if (attr.name == "name") {
                sheet_name = std::string(attr.value);
            } else if (attr.name == "sheetId") {
                sheet_id = std::string(attr.value);
            } else if (attr.name == "state") {
                state = std::string(attr.value);
            } else if (isRelationshipIdAttribute(attr.name)) {
                rel_id = std::string(attr.value);
            }
        }

        if (sheet_name.empty() || rel_id.empty()) {
            setError("Sheet element is missing name or r:id attribute");
            return;
        }

        WorksheetInfo worksheet_info(sheet_name, sheet_id, rel_id);
        worksheet_info.hidden = (state == "hidden" || state == "veryHidden");

        auto rel_it = relationships_.find(rel_id);
        if (rel_it != relationships_.end()) {
            worksheet_info.worksheet_path = RelationshipsParser::resolvePartPath(base_dir_, rel_it->second);
        } else {
            // 回退到默认路径构造方式
            worksheet_info.worksheet_path = base_dir_ + "worksheets/sheet" + sheet_id + ".xml";
            READER_WARN("Relationship {} not found, falling back to {}",
                        rel_id, worksheet_info.worksheet_path);
        }

        READER_DEBUG("Found sheet: {} (ID: {}) -> {}",
                     sheet_name, sheet_id, worksheet_info.worksheet_path);
        worksheets_.push_back(std::move(worksheet_info));
    }
}

void WorkbookParser::onEndElement(std::string_view name, int /* depth */) {
    if (name == "sheets") {
        in_sheets_section_ = false;
        READER_DEBUG("Parsed sheet list, {} sheets", worksheets_.size());
    }
}

}} // namespace excelpager::reader
