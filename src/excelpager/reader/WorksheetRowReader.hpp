/**
 * @file WorksheetRowReader.hpp
 * @brief 工作表行游标：按需解压、按需解析 sheetData 中的行
 */

#pragma once

#include "BaseSAXParser.hpp"
#include "excelpager/core/Expected.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace excelpager {
namespace reader {

/**
 * @brief 单元格 t 属性对应的类型
 */
enum class CellType : uint8_t {
    Number,         // 缺省或 t="n"
    SharedString,   // t="s"
    InlineString,   // t="inlineStr"
    FormulaString,  // t="str"
    Boolean,        // t="b"
    Error,          // t="e"
    Date,           // t="d"
    Unknown
};

CellType parseCellType(std::string_view type_attr);

/**
 * @brief 未解码的单元格
 */
struct RawCell {
    uint32_t column = 0;          // 1-based
    CellType type = CellType::Number;
    std::string type_attr;        // 仅 Unknown 时保存原始 t 属性，用于报错
    uint32_t style = 0;           // s 属性（cellXfs 索引）
    std::string text;             // <v> 文本或内联字符串文本
};

/**
 * @brief 未解码的行（只包含有值的单元格）
 */
struct RawRow {
    uint32_t number = 0;          // 物理行号，1-based
    std::vector<RawCell> cells;
};

/**
 * @brief 工作表行游标（惰性、只进、不可重启）
 *
 * 每次只解压一个数据块喂给expat，解析出的行进入队列；调用方拉取。
 * - skipTo(n) 之后，行号小于 n 的行只解析结构（行号），不保存单元格
 * - scanToEnd() 之后不再保存任何单元格，只统计最大行号
 * - 每个数据块、每行轮询一次取消令牌
 *
 * 行号必须严格递增，否则视为工作表损坏。
 */
class WorksheetRowReader : public BaseSAXParser {
public:
    WorksheetRowReader(std::unique_ptr<archive::EntryStream> stream, core::CancellationToken token);
    ~WorksheetRowReader() override;

    /**
     * @brief 解析到 <sheetData> 开始（或第一行）为止，之后 dimensionLastRow() 可用
     */
    core::VoidResult prime();

    /**
     * @brief 取下一行
     * @return true 表示 row 有效，false 表示已到工作表末尾
     */
    core::Result<bool> next(RawRow& row);

    /**
     * @brief 查看下一行但不取出
     * @return 已到末尾时为 nullptr
     */
    core::Result<const RawRow*> peek();

    /**
     * @brief 跳到行号不小于 row_number 的第一行
     */
    void skipTo(uint32_t row_number);

    /**
     * @brief 消费剩余全部行，只统计行号
     * @return 整个工作表出现过的最大行号（没有任何行时为 0）
     */
    core::Result<uint32_t> scanToEnd();

    /**
     * @brief <dimension ref> 中的最后一行，元素缺失或无效时为空
     */
    std::optional<uint32_t> dimensionLastRow() const { return dimension_last_row_; }

    const std::string& path() const { return path_; }

protected:
    bool preserveWhitespace() const override { return true; }

    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

private:
    std::unique_ptr<archive::EntryStream> stream_;
    core::CancellationToken token_;
    std::string path_;
    xml::XMLStreamReader xml_reader_;
    std::vector<uint8_t> buffer_;
    std::deque<RawRow> ready_;
    bool begun_ = false;
    bool finished_ = false;
    bool xml_failed_ = false;   // expat 报错（否则为结构错误）

    // 行过滤
    uint32_t skip_below_ = 0;
    bool count_only_ = false;

    // 解析状态
    bool seen_sheet_data_ = false;
    bool in_sheet_data_ = false;
    bool in_row_ = false;
    bool materialize_row_ = false;
    bool in_cell_ = false;
    bool cell_has_value_ = false;
    bool in_inline_string_ = false;
    bool in_phonetic_ = false;
    uint32_t last_row_number_ = 0;
    uint32_t last_column_ = 0;
    uint32_t highest_row_ = 0;
    std::optional<uint32_t> dimension_last_row_;
    RawRow current_row_;
    RawCell current_cell_;

    core::VoidResult fill();
    core::Error currentError() const;
    core::Error cancelledError() const;
    void dropSkippedRows();
};

}} // namespace excelpager::reader
