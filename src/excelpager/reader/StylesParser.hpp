#pragma once

#include "BaseSAXParser.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace excelpager {
namespace reader {

/**
 * @brief 样式解析器（xl/styles.xml）
 *
 * 只关心判断单元格值类型所需的部分：
 * <numFmts> 自定义数字格式和 <cellXfs> 中每个XF引用的 numFmtId。
 * 字体、填充、边框等区域直接跳过。
 */
class StylesParser : public BaseSAXParser {
public:
    bool parse(std::string_view xml_content) {
        clear();
        return parseXML(xml_content);
    }

    void clear() {
        number_formats_.clear();
        xf_num_fmt_ids_.clear();
        in_num_fmts_ = false;
        in_cell_xfs_ = false;
    }

    /**
     * @brief 指定XF索引的单元格是否使用日期/时间格式
     */
    bool isDateStyle(uint32_t xf_index) const;

    /**
     * @brief XF索引对应的 numFmtId，索引无效时返回 0（General）
     */
    int getNumberFormatId(uint32_t xf_index) const;

    /**
     * @brief 自定义格式代码，内置格式返回空串
     */
    std::string getFormatCode(int num_fmt_id) const;

    size_t getCellXfCount() const { return xf_num_fmt_ids_.size(); }

    static bool isBuiltinDateFormat(int num_fmt_id);

    /**
     * @brief 格式代码是否表示日期/时间
     *
     * 去掉引号内文字、转义字符和方括号段（[h]、[mm]、[ss] 这类经过时间除外）后，
     * 只要还含有 d/m/y/h/s 即视为日期格式。
     */
    static bool isDateFormatCode(std::string_view format_code);

private:
    std::unordered_map<int, std::string> number_formats_;
    std::vector<int> xf_num_fmt_ids_;
    bool in_num_fmts_ = false;
    bool in_cell_xfs_ = false;

    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;
};

}} // namespace excelpager::reader
