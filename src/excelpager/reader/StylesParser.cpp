#include "excelpager/reader/StylesParser.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <cctype>

namespace excelpager {
namespace reader {

void StylesParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name == "numFmts") {
        in_num_fmts_ = true;
    } else if (name == "numFmt" && in_num_fmts_) {
        auto id = findIntAttribute(attributes, "numFmtId");
        auto code = findAttribute(attributes, "formatCode");
        if (id && code) {
            number_formats_[static_cast<int>(*id)] = std::string(*code);
        }
    } else if (name == "cellXfs") {
        in_cell_xfs_ = true;
    } else if (name == "xf" && in_cell_xfs_) {
        auto id = findIntAttribute(attributes, "numFmtId");
        xf_num_fmt_ids_.push_back(id ? static_cast<int>(*id) : 0);
    }
}

void StylesParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "numFmts") {
        in_num_fmts_ = false;
    } else if (name == "cellXfs") {
        in_cell_xfs_ = false;
        READER_DEBUG("Parsed {} cell formats, {} custom number formats",
                     xf_num_fmt_ids_.size(), number_formats_.size());
    }
}

int StylesParser::getNumberFormatId(uint32_t xf_index) const {
    if (xf_index >= xf_num_fmt_ids_.size()) {
        return 0;
    }
    return xf_num_fmt_ids_[xf_index];
}

std::string StylesParser::getFormatCode(int num_fmt_id) const {
    auto it = number_formats_.find(num_fmt_id);
    return it != number_formats_.end() ? it->second : std::string();
}

bool StylesParser::isDateStyle(uint32_t xf_index) const {
    int num_fmt_id = getNumberFormatId(xf_index);
    auto it = number_formats_.find(num_fmt_id);
    if (it != number_formats_.end()) {
        return isDateFormatCode(it->second);
    }
    return isBuiltinDateFormat(num_fmt_id);
}

bool StylesParser::isBuiltinDateFormat(int num_fmt_id) {
    return (num_fmt_id >= 14 && num_fmt_id <= 22) ||
           (num_fmt_id >= 27 && num_fmt_id <= 36) ||
           (num_fmt_id >= 45 && num_fmt_id <= 47) ||
           (num_fmt_id >= 50 && num_fmt_id <= 58);
}

bool StylesParser::isDateFormatCode(std::string_view format_code) {
    // 只看第一段（正数格式）
    size_t i = 0;
    while (i < format_code.size()) {
        char c = format_code[i];
        if (c == ';') {
            break;
        }
        if (c == '"') {
            size_t close = format_code.find('"', i + 1);
            if (close == std::string_view::npos) {
                break;
            }
            i = close + 1;
            continue;
        }
        if (c == '\\' || c == '_' || c == '*') {
            i += 2;
            continue;
        }
        if (c == '[') {
            size_t close = format_code.find(']', i + 1);
            if (close == std::string_view::npos) {
                break;
            }
            std::string_view inner = format_code.substr(i + 1, close - i - 1);
            bool elapsed = !inner.empty();
            for (char e : inner) {
                char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(e)));
                if (lower != 'h' && lower != 'm' && lower != 's') {
                    elapsed = false;
                    break;
                }
            }
            if (elapsed) {
                return true;
            }
            i = close + 1;
            continue;
        }

        char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower == 'd' || lower == 'm' || lower == 'y' || lower == 'h' || lower == 's') {
            return true;
        }
        ++i;
    }
    return false;
}

}} // namespace excelpager::reader
