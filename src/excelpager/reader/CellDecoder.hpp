#pragma once

#include "excelpager/core/CellValue.hpp"
#include "excelpager/core/Expected.hpp"
#include "excelpager/reader/WorksheetRowReader.hpp"
#include <cstdint>
#include <unordered_set>
#include <vector>

namespace excelpager {
namespace reader {

class StylesParser;
class SharedStringsParser;

/**
 * @brief 原始单元格到 CellValue 的解码器
 *
 * - 数字：含小数点或指数的为 double，否则为 int64（溢出时退回 double）
 * - 数字格式为日期的数字单元格解码为 DateTime
 * - 共享字符串按索引查表，索引不存在时报 InvalidCellValue
 *
 * styles 与 shared_strings 可为空（工作簿中没有对应部件）。
 */
class CellDecoder {
public:
    CellDecoder(const StylesParser* styles, const SharedStringsParser* shared_strings, bool date1904)
        : styles_(styles), shared_strings_(shared_strings), date1904_(date1904) {}

    core::Result<core::CellValue> decode(const RawCell& cell) const;

    /**
     * @brief 解码一整行，按列号定位；缺少的列为缺失值，同一列出现多次时后者生效
     */
    core::Result<core::Row> decodeRow(const RawRow& row) const;

    /**
     * @brief 收集若干行引用到的共享字符串索引
     * @return 出现无效索引文本时返回 InvalidCellValue
     */
    static core::VoidResult collectSharedStringIndices(const std::vector<RawRow>& rows,
                                                       std::unordered_set<uint32_t>& indices);

private:
    const StylesParser* styles_;
    const SharedStringsParser* shared_strings_;
    bool date1904_;

    core::Result<core::CellValue> decodeNumber(const RawCell& cell) const;
    core::Error invalidValue(const RawCell& cell, const std::string& reason) const;
};

}} // namespace excelpager::reader
