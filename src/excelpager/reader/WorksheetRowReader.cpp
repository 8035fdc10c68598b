/**
 * @file WorksheetRowReader.cpp
 * @brief 工作表行游标实现
 */

#include "excelpager/reader/WorksheetRowReader.hpp"
#include "excelpager/core/Constants.hpp"
#include "excelpager/utils/ColumnReferenceUtils.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace excelpager {
namespace reader {

CellType parseCellType(std::string_view type_attr) {
    if (type_attr.empty() || type_attr == "n") return CellType::Number;
    if (type_attr == "s") return CellType::SharedString;
    if (type_attr == "inlineStr") return CellType::InlineString;
    if (type_attr == "str") return CellType::FormulaString;
    if (type_attr == "b") return CellType::Boolean;
    if (type_attr == "e") return CellType::Error;
    if (type_attr == "d") return CellType::Date;
    return CellType::Unknown;
}

WorksheetRowReader::WorksheetRowReader(std::unique_ptr<archive::EntryStream> stream,
                                       core::CancellationToken token)
    : stream_(std::move(stream))
    , token_(std::move(token))
    , path_(stream_ ? stream_->path() : std::string())
    , buffer_(core::Constants::kIOBufferSize) {
    state_.reset();
    bindCallbacks(xml_reader_);
}

WorksheetRowReader::~WorksheetRowReader() = default;

core::Error WorksheetRowReader::currentError() const {
    return core::Error(xml_failed_ ? core::ErrorCode::XmlParseError : core::ErrorCode::InvalidWorksheet,
                       "Failed to parse worksheet: " + state_.error_message, path_);
}

core::Error WorksheetRowReader::cancelledError() const {
    return core::Error(core::ErrorCode::Cancelled, "Request cancelled while reading worksheet", path_);
}

core::VoidResult WorksheetRowReader::fill() {
    if (finished_) {
        return {};
    }
    if (!stream_) {
        return core::Error(core::ErrorCode::InternalError, "Worksheet stream not open", path_);
    }
    if (token_.isCancelled()) {
        return cancelledError();
    }

    if (!begun_) {
        if (xml::isError(xml_reader_.beginParsing())) {
            return core::Error(core::ErrorCode::XmlParseError, xml_reader_.getLastErrorMessage(), path_);
        }
        begun_ = true;
    }

    size_t bytes_read = 0;
    archive::ZipError zip_result = stream_->read(buffer_.data(), buffer_.size(), bytes_read);
    if (archive::isError(zip_result)) {
        finished_ = true;
        return core::Error(core::ErrorCode::ZipError,
                           std::string("Failed to decompress worksheet: ") + archive::toString(zip_result),
                           path_);
    }

    xml::XMLParseError result;
    if (bytes_read == 0) {
        finished_ = true;
        result = xml_reader_.endParsing();
    } else {
        result = xml_reader_.feedData(reinterpret_cast<const char*>(buffer_.data()), bytes_read);
    }

    if (xml::isError(result) && !state_.has_error) {
        xml_failed_ = true;
        setError(xml_reader_.getLastErrorMessage().empty()
                     ? std::string("XML parsing failed: ") + xml::toString(result)
                     : xml_reader_.getLastErrorMessage());
    }
    if (state_.has_error) {
        finished_ = true;
        ready_.clear();
        return currentError();
    }
    return {};
}

core::VoidResult WorksheetRowReader::prime() {
    while (!seen_sheet_data_ && ready_.empty() && !finished_) {
        auto result = fill();
        if (!result) {
            return result;
        }
    }
    READER_DEBUG("Worksheet {} primed, dimension last row: {}", path_,
                 dimension_last_row_ ? static_cast<int64_t>(*dimension_last_row_) : -1);
    return {};
}

void WorksheetRowReader::dropSkippedRows() {
    while (!ready_.empty() && ready_.front().number < skip_below_) {
        ready_.pop_front();
    }
}

core::Result<const RawRow*> WorksheetRowReader::peek() {
    for (;;) {
        dropSkippedRows();
        if (!ready_.empty()) {
            return static_cast<const RawRow*>(&ready_.front());
        }
        if (finished_) {
            return static_cast<const RawRow*>(nullptr);
        }
        auto result = fill();
        if (!result) {
            return result.error();
        }
    }
}

core::Result<bool> WorksheetRowReader::next(RawRow& row) {
    if (token_.isCancelled()) {
        return cancelledError();
    }

    auto front = peek();
    if (!front) {
        return front.error();
    }
    if (*front == nullptr) {
        return false;
    }

    row = std::move(ready_.front());
    ready_.pop_front();
    return true;
}

void WorksheetRowReader::skipTo(uint32_t row_number) {
    skip_below_ = std::max(skip_below_, row_number);
    dropSkippedRows();
}

core::Result<uint32_t> WorksheetRowReader::scanToEnd() {
    count_only_ = true;
    ready_.clear();
    while (!finished_) {
        auto result = fill();
        if (!result) {
            return result.error();
        }
    }
    READER_DEBUG("Scanned worksheet {} to end, highest row {}", path_, highest_row_);
    return highest_row_;
}

void WorksheetRowReader::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (in_cell_) {
        if (name == "v") {
            startCollectingText();
        } else if (name == "is") {
            in_inline_string_ = true;
            cell_has_value_ = true;
        } else if (name == "rPh") {
            in_phonetic_ = true;
        } else if (name == "t" && in_inline_string_ && !in_phonetic_) {
            startCollectingText();
        }
        return;
    }

    if (name == "c" && in_row_) {
        in_cell_ = true;
        cell_has_value_ = false;
        in_inline_string_ = false;
        in_phonetic_ = false;
        if (!materialize_row_) {
            return;
        }

        current_cell_ = RawCell();
        uint32_t column = 0;
        if (auto ref = findAttribute(attributes, "r")) {
            column = utils::ColumnReferenceUtils::parseColumnFast(*ref);
            if (column == 0) {
                setError("Invalid cell reference '" + std::string(*ref) + "' in row " +
                         std::to_string(current_row_.number));
                return;
            }
        } else {
            column = last_column_ + 1;
        }
        current_cell_.column = column;
        last_column_ = column;

        if (auto type = findAttribute(attributes, "t")) {
            current_cell_.type = parseCellType(*type);
            if (current_cell_.type == CellType::Unknown) {
                current_cell_.type_attr = std::string(*type);
            }
        }
        if (auto style = findIntAttribute(attributes, "s")) {
            current_cell_.style = *style >= 0 ? static_cast<uint32_t>(*style) : 0;
        }
    } else if (name == "row" && in_sheet_data_) {
        uint32_t number = last_row_number_ + 1;
        if (findAttribute(attributes, "r")) {
            auto parsed = findIntAttribute(attributes, "r");
            if (!parsed || *parsed < 1 || *parsed > static_cast<int64_t>(core::Constants::kMaxRows)) {
                setError("Invalid row number '" + getAttributeOr(attributes, "r", "") + "'");
                return;
            }
            number = static_cast<uint32_t>(*parsed);
        }
        if (number <= last_row_number_) {
            setError("Row " + std::to_string(number) + " appears after row " +
                     std::to_string(last_row_number_));
            return;
        }

        in_row_ = true;
        last_row_number_ = number;
        last_column_ = 0;
        highest_row_ = std::max(highest_row_, number);
        materialize_row_ = !count_only_ && number >= skip_below_;
        if (materialize_row_) {
            current_row_.number = number;
            current_row_.cells.clear();
        }
    } else if (name == "sheetData") {
        seen_sheet_data_ = true;
        in_sheet_data_ = true;
    } else if (name == "dimension") {
        uint32_t last_row = 0;
        auto ref = findAttribute(attributes, "ref");
        if (ref && utils::ColumnReferenceUtils::parseRangeLastRow(*ref, last_row)) {
            dimension_last_row_ = last_row;
        } else {
            READER_DEBUG("Ignoring malformed dimension in {}", path_);
        }
    }
}

void WorksheetRowReader::onEndElement(std::string_view name, int /*depth*/) {
    if (in_cell_) {
        if (name == "v") {
            // 空 <v/> 只对公式字符串有意义
            if (materialize_row_ &&
                (!getCurrentText().empty() || current_cell_.type == CellType::FormulaString)) {
                current_cell_.text = getCurrentText();
                cell_has_value_ = true;
            }
            stopCollectingText();
        } else if (name == "t" && in_inline_string_ && !in_phonetic_) {
            if (materialize_row_) {
                current_cell_.text += getCurrentText();
            }
            stopCollectingText();
        } else if (name == "rPh") {
            in_phonetic_ = false;
        } else if (name == "is") {
            in_inline_string_ = false;
        } else if (name == "c") {
            in_cell_ = false;
            if (materialize_row_ && cell_has_value_) {
                current_row_.cells.push_back(std::move(current_cell_));
            }
        }
        return;
    }

    if (name == "row" && in_row_) {
        in_row_ = false;
        if (materialize_row_) {
            READER_TRACE("Row {} parsed with {} cells", current_row_.number, current_row_.cells.size());
            ready_.push_back(std::move(current_row_));
            current_row_ = RawRow();
        }
        materialize_row_ = false;
    } else if (name == "sheetData") {
        in_sheet_data_ = false;
    }
}

}} // namespace excelpager::reader
