#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace excelpager {
namespace core {

/**
 * @brief 日期时间值（不带时区）
 *
 * 由数字格式为日期的单元格（Excel序列号）或 t="d" 的ISO单元格得到。
 */
struct DateTime {
    int year = 1900;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;

    /**
     * @brief ISO-8601 文本，如 "2024-01-15T10:30:00"，毫秒非零时追加 ".123"
     *
     * 纯日期也输出时间部分（"2024-01-15T00:00:00"）。
     */
    std::string toIsoString() const;

    bool operator==(const DateTime& other) const;
    bool operator!=(const DateTime& other) const { return !(*this == other); }
};

/**
 * @brief 单元格标量值
 *
 * std::monostate 表示缺失（absent）：XML中不存在的单元格、
 * 没有值的单元格，以及记录中超出行长度的表头字段。
 */
using CellValue = std::variant<std::monostate, std::string, int64_t, double, bool, DateTime>;

using Row = std::vector<CellValue>;
using Header = std::vector<std::string>;

/**
 * @brief 记录中的一个字段
 */
struct Field {
    std::string name;
    CellValue value;
};

/**
 * @brief 一行数据与表头按位置配对后的结果
 *
 * 保留表头的全部列（包括重名、空名的列），顺序与表头一致。
 */
using Record = std::vector<Field>;

inline bool isAbsent(const CellValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

/**
 * @brief 缺失或空文本视为空白
 */
bool isBlank(const CellValue& value);

/**
 * @brief 所有单元格都为空白（或没有单元格）的行
 */
bool isBlankRow(const Row& row);

/**
 * @brief 单元格值转为文本，用于表头字段名
 *
 * 缺失值转为空串；整数、浮点数、布尔值、日期按JSON书写习惯输出。
 */
std::string toText(const CellValue& value);

/**
 * @brief 表头行转为字段名序列
 */
Header makeHeader(const Row& header_row);

/**
 * @brief 将一行数据与表头按位置配对
 *
 * 行比表头短时，缺少的字段以缺失值补齐；行比表头长时，多出的单元格丢弃。
 */
Record pairRecord(const Header& header, const Row& row);

}} // namespace excelpager::core
