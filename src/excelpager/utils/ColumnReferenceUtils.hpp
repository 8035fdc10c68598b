/**
 * @file ColumnReferenceUtils.hpp
 * @brief 单元格引用解析工具
 */

#pragma once

#include <string_view>
#include <cstdint>

namespace excelpager {
namespace utils {

/**
 * @brief 单元格引用解析（"C23"、"AA1"、"A1:C100"）
 *
 * 所有函数在输入无效时返回 0 / false，不抛异常。
 */
class ColumnReferenceUtils {
public:
    /**
     * @brief 解析单元格引用中的列号
     * @param cell_ref 单元格引用（如 "C23"）
     * @return 列号（1-based，如 C=3），无效时返回 0
     */
    static uint32_t parseColumnFast(std::string_view cell_ref);

    /**
     * @brief 解析纯列引用到列号（"C"、"AA"、"$XFD"）
     */
    static uint32_t parseColumnOnly(std::string_view col_ref);

    /**
     * @brief 解析单元格引用中的行号
     * @return 行号（1-based），无效时返回 0
     */
    static uint32_t parseRowFast(std::string_view cell_ref);

    /**
     * @brief 解析完整的单元格引用，允许 "$" 绝对引用标记
     */
    static bool parseCellReference(std::string_view cell_ref, uint32_t& row, uint32_t& col);

    /**
     * @brief 解析区域引用的最后一行（"A1:C100" -> 100，"A1" -> 1）
     */
    static bool parseRangeLastRow(std::string_view range_ref, uint32_t& last_row);
};

}} // namespace excelpager::utils
