#include "excelpager/core/CellValue.hpp"
#include <fmt/format.h>

namespace excelpager {
namespace core {

std::string DateTime::toIsoString() const {
    if (millisecond != 0) {
        return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}",
                           year, month, day, hour, minute, second, millisecond);
    }
    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}",
                       year, month, day, hour, minute, second);
}

bool DateTime::operator==(const DateTime& other) const {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute && second == other.second &&
           millisecond == other.millisecond;
}

bool isBlank(const CellValue& value) {
    if (isAbsent(value)) {
        return true;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return text->empty();
    }
    return false;
}

bool isBlankRow(const Row& row) {
    for (const auto& value : row) {
        if (!isBlank(value)) {
            return false;
        }
    }
    return true;
}

namespace {

struct TextVisitor {
    std::string operator()(std::monostate) const { return std::string(); }
    std::string operator()(const std::string& text) const { return text; }
    std::string operator()(int64_t number) const { return fmt::format("{}", number); }
    std::string operator()(double number) const { return fmt::format("{}", number); }
    std::string operator()(bool flag) const { return flag ? "true" : "false"; }
    std::string operator()(const DateTime& dt) const { return dt.toIsoString(); }
};

} // namespace

std::string toText(const CellValue& value) {
    return std::visit(TextVisitor{}, value);
}

Header makeHeader(const Row& header_row) {
    Header header;
    header.reserve(header_row.size());
    for (const auto& value : header_row) {
        header.push_back(toText(value));
    }
    return header;
}

Record pairRecord(const Header& header, const Row& row) {
    Record record;
    record.reserve(header.size());
    for (size_t i = 0; i < header.size(); ++i) {
        if (i < row.size()) {
            record.push_back(Field{header[i], row[i]});
        } else {
            record.push_back(Field{header[i], CellValue{}});
        }
    }
    return record;
}

}} // namespace excelpager::core
