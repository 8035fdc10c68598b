#include "excelpager/reader/CellDecoder.hpp"
#include "excelpager/reader/SharedStringsParser.hpp"
#include "excelpager/reader/StylesParser.hpp"
#include "excelpager/utils/TimeUtils.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <fast_float/fast_float.h>
#include <fmt/format.h>

namespace excelpager {
namespace reader {

namespace {

bool parseIndex(const std::string& text, uint32_t& index) {
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, index);
    return !text.empty() && ec == std::errc() && ptr == last;
}

} // namespace

core::Error CellDecoder::invalidValue(const RawCell& cell, const std::string& reason) const {
    return core::Error(core::ErrorCode::InvalidCellValue,
                       fmt::format("{} in column {}", reason, cell.column));
}

core::Result<core::CellValue> CellDecoder::decodeNumber(const RawCell& cell) const {
    const std::string& text = cell.text;
    const char* first = text.data();
    const char* last = text.data() + text.size();

    bool is_float = text.find_first_of(".eE") != std::string::npos;
    double number = 0.0;

    if (!is_float) {
        int64_t integer = 0;
        auto [ptr, ec] = std::from_chars(first, last, integer);
        if (ec == std::errc() && ptr == last) {
            if (styles_ && styles_->isDateStyle(cell.style)) {
                if (auto date = utils::TimeUtils::fromExcelSerial(static_cast<double>(integer), date1904_)) {
                    return core::CellValue(*date);
                }
            }
            return core::CellValue(integer);
        }
        if (ec != std::errc::result_out_of_range || ptr != last) {
            return invalidValue(cell, "Invalid numeric value '" + text + "'");
        }
    }

    // fast_float 不接受前导 '+'
    if (first != last && *first == '+') {
        ++first;
    }
    auto result = fast_float::from_chars(first, last, number);
    if (result.ec != std::errc() || result.ptr != last) {
        return invalidValue(cell, "Invalid numeric value '" + text + "'");
    }

    if (styles_ && styles_->isDateStyle(cell.style)) {
        if (auto date = utils::TimeUtils::fromExcelSerial(number, date1904_)) {
            return core::CellValue(*date);
        }
        READER_DEBUG("Serial {} out of date range, keeping number", number);
    }
    return core::CellValue(number);
}

core::Result<core::CellValue> CellDecoder::decode(const RawCell& cell) const {
    switch (cell.type) {
        case CellType::Number:
            return decodeNumber(cell);

        case CellType::SharedString: {
            uint32_t index = 0;
            if (!parseIndex(cell.text, index)) {
                return invalidValue(cell, "Invalid shared string index '" + cell.text + "'");
            }
            const std::string* str = shared_strings_ ? shared_strings_->getString(index) : nullptr;
            if (!str) {
                return invalidValue(cell, "Shared string index " + cell.text + " not found");
            }
            return core::CellValue(*str);
        }

        case CellType::InlineString:
        case CellType::FormulaString:
        case CellType::Error:
            return core::CellValue(cell.text);

        case CellType::Boolean:
            if (cell.text == "1" || cell.text == "true") return core::CellValue(true);
            if (cell.text == "0" || cell.text == "false") return core::CellValue(false);
            return invalidValue(cell, "Invalid boolean value '" + cell.text + "'");

        case CellType::Date:
            if (auto date = utils::TimeUtils::parseIsoDateTime(cell.text)) {
                return core::CellValue(*date);
            }
            return invalidValue(cell, "Invalid date value '" + cell.text + "'");

        case CellType::Unknown:
        default:
            return invalidValue(cell, "Unknown cell type '" + cell.type_attr + "'");
    }
}

core::Result<core::Row> CellDecoder::decodeRow(const RawRow& row) const {
    core::Row values;
    uint32_t max_column = 0;
    for (const auto& cell : row.cells) {
        max_column = std::max(max_column, cell.column);
    }
    values.resize(max_column);

    for (const auto& cell : row.cells) {
        auto value = decode(cell);
        if (!value) {
            core::Error error = value.error();
            error.context = "row " + std::to_string(row.number);
            return error;
        }
        values[cell.column - 1] = std::move(value).value();
    }
    return values;
}

core::VoidResult CellDecoder::collectSharedStringIndices(const std::vector<RawRow>& rows,
                                                         std::unordered_set<uint32_t>& indices) {
    for (const auto& row : rows) {
        for (const auto& cell : row.cells) {
            if (cell.type != CellType::SharedString) {
                continue;
            }
            uint32_t index = 0;
            if (!parseIndex(cell.text, index)) {
                return core::Error(core::ErrorCode::InvalidCellValue,
                                   "Invalid shared string index '" + cell.text + "'",
                                   "row " + std::to_string(row.number));
            }
            indices.insert(index);
        }
    }
    return {};
}

}} // namespace excelpager::reader
