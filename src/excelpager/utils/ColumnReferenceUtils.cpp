/**
 * @file ColumnReferenceUtils.cpp
 * @brief 单元格引用解析工具实现
 */

#include "excelpager/utils/ColumnReferenceUtils.hpp"
#include "excelpager/core/Constants.hpp"
#include <cctype>

namespace excelpager {
namespace utils {

namespace {

inline bool isAsciiAlpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

inline bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

// 拆分为列字母与行数字两部分，跳过 "$"
bool splitReference(std::string_view ref, std::string_view& letters, std::string_view& digits) {
    size_t pos = 0;
    if (pos < ref.size() && ref[pos] == '$') ++pos;

    size_t letters_begin = pos;
    while (pos < ref.size() && isAsciiAlpha(ref[pos])) ++pos;
    letters = ref.substr(letters_begin, pos - letters_begin);

    if (pos < ref.size() && ref[pos] == '$') ++pos;

    size_t digits_begin = pos;
    while (pos < ref.size() && isAsciiDigit(ref[pos])) ++pos;
    digits = ref.substr(digits_begin, pos - digits_begin);

    return pos == ref.size();
}

uint32_t parseDigits(std::string_view digits) {
    if (digits.empty() || digits.size() > 7) return 0;
    uint32_t value = 0;
    for (char c : digits) {
        value = value * 10 + static_cast<uint32_t>(c - '0');
    }
    if (value > static_cast<uint32_t>(core::Constants::kMaxRows)) return 0;
    return value;
}

} // namespace

uint32_t ColumnReferenceUtils::parseColumnFast(std::string_view cell_ref) {
    std::string_view letters;
    std::string_view digits;
    splitReference(cell_ref, letters, digits);
    return parseColumnOnly(letters);
}

uint32_t ColumnReferenceUtils::parseColumnOnly(std::string_view col_ref) {
    if (!col_ref.empty() && col_ref[0] == '$') {
        col_ref.remove_prefix(1);
    }
    if (col_ref.empty() || col_ref.size() > 3) return 0;

    uint32_t col = 0;
    for (char c : col_ref) {
        if (!isAsciiAlpha(c)) return 0;
        col = col * 26 + static_cast<uint32_t>(std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
    }

    if (col > static_cast<uint32_t>(core::Constants::kMaxColumns)) return 0;
    return col;
}

uint32_t ColumnReferenceUtils::parseRowFast(std::string_view cell_ref) {
    std::string_view letters;
    std::string_view digits;
    if (!splitReference(cell_ref, letters, digits)) return 0;
    return parseDigits(digits);
}

bool ColumnReferenceUtils::parseCellReference(std::string_view cell_ref, uint32_t& row, uint32_t& col) {
    std::string_view letters;
    std::string_view digits;
    if (!splitReference(cell_ref, letters, digits)) return false;

    col = parseColumnOnly(letters);
    row = parseDigits(digits);
    return col > 0 && row > 0;
}

bool ColumnReferenceUtils::parseRangeLastRow(std::string_view range_ref, uint32_t& last_row) {
    size_t colon = range_ref.find(':');
    std::string_view last = colon == std::string_view::npos ? range_ref : range_ref.substr(colon + 1);

    uint32_t row = 0;
    uint32_t col = 0;
    if (!parseCellReference(last, row, col)) {
        return false;
    }
    last_row = row;
    return true;
}

}} // namespace excelpager::utils
