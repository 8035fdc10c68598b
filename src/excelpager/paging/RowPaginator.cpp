/**
 * @file RowPaginator.cpp
 * @brief 流式分页实现
 */

#include "excelpager/paging/RowPaginator.hpp"
#include "excelpager/core/Constants.hpp"
#include "excelpager/reader/CellDecoder.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include "excelpager/utils/TimeUtils.hpp"
#include "excelpager/utils/UrlCodec.hpp"
#include <algorithm>
#include <limits>
#include <unordered_set>

namespace excelpager {
namespace paging {

namespace {

constexpr int64_t kHeaderRow = 1;

// 窗口起止行号，超出工作表最大行数时截断（窗口必然为空）
struct Window {
    int64_t first;   // 含
    int64_t last;    // 含
};

Window computeWindow(int64_t page, int64_t page_size) {
    const int64_t limit = static_cast<int64_t>(core::Constants::kMaxRows) + 1;
    if (page - 1 > limit / page_size) {
        return Window{limit, limit};
    }
    int64_t first = (page - 1) * page_size + 2;
    int64_t last = first + page_size - 1;
    return Window{std::min(first, limit), std::min(last, limit)};
}

} // namespace

RowPaginator::RowPaginator(int64_t page_size, core::RowCountMode count_mode)
    : page_size_(page_size > 0 ? page_size : core::Constants::kDefaultPageSize)
    , count_mode_(count_mode) {}

std::string RowPaginator::buildPageUrl(const std::string& file, const std::optional<std::string>& sheet,
                                       int64_t page) {
    std::string url = "/file/" + utils::UrlCodec::encodePathSegment(file);
    if (sheet) {
        url += "/sheet/" + utils::UrlCodec::encodePathSegment(*sheet);
    }
    url += "?page=" + std::to_string(page);
    return url;
}

core::Result<Page> RowPaginator::fetchPage(locator::SheetHandle& handle, int64_t page, bool sheet_addressed,
                                           const core::CancellationToken& token) const {
    if (page < 1) {
        return core::Error(core::ErrorCode::InvalidArgument, "Invalid page value");
    }

    utils::TimeUtils::PerformanceTimer timer;
    reader::XLSXPackage& package = handle.package();
    const Window window = computeWindow(page, page_size_);

    // 样式在打开工作表之前加载（同一时间只能打开一个ZIP条目）
    auto styles = package.styles();
    if (!styles) {
        return styles.error();
    }

    reader::RawRow header_raw;
    std::vector<reader::RawRow> window_rows;
    uint32_t highest_row = 0;
    {
        auto opened = package.openWorksheet(handle.sheet(), token);
        if (!opened) {
            return opened.error();
        }
        std::unique_ptr<reader::WorksheetRowReader> rows = std::move(opened).value();

        auto first = rows->peek();
        if (!first) {
            return first.error();
        }
        if (*first && (*first)->number == kHeaderRow) {
            auto taken = rows->next(header_raw);
            if (!taken) {
                return taken.error();
            }
        }

        rows->skipTo(static_cast<uint32_t>(window.first));
        for (;;) {
            auto next = rows->peek();
            if (!next) {
                return next.error();
            }
            if (*next == nullptr || (*next)->number > window.last) {
                break;
            }
            reader::RawRow row;
            auto taken = rows->next(row);
            if (!taken) {
                return taken.error();
            }
            window_rows.push_back(std::move(row));
        }

        std::optional<uint32_t> dimension = rows->dimensionLastRow();
        if (count_mode_ == core::RowCountMode::Dimension && dimension) {
            highest_row = *dimension;
        } else {
            if (count_mode_ == core::RowCountMode::Dimension) {
                PAGER_DEBUG("No usable dimension in '{}', counting rows by scan", handle.sheetName());
            }
            auto scanned = rows->scanToEnd();
            if (!scanned) {
                return scanned.error();
            }
            highest_row = *scanned;
        }
    }

    if (token.isCancelled()) {
        return core::Error(core::ErrorCode::Cancelled, "Request cancelled", handle.file());
    }

    std::unordered_set<uint32_t> wanted;
    auto collected = reader::CellDecoder::collectSharedStringIndices({header_raw}, wanted);
    if (collected) {
        collected = reader::CellDecoder::collectSharedStringIndices(window_rows, wanted);
    }
    if (!collected) {
        return collected.error();
    }

    auto shared_strings = package.loadSharedStrings(wanted, token);
    if (!shared_strings) {
        return shared_strings.error();
    }

    reader::CellDecoder decoder(*styles, shared_strings->get(), package.isDate1904());

    auto header_row = decoder.decodeRow(header_raw);
    if (!header_row) {
        return header_row.error();
    }
    const core::Header header = core::makeHeader(*header_row);

    Page result;
    result.file = handle.file();
    if (sheet_addressed) {
        result.sheet = handle.sheetName();
    }
    result.page = page;
    result.per_page = page_size_;

    size_t blank_rows = static_cast<size_t>(window.last - window.first + 1) - window_rows.size();
    for (const auto& raw : window_rows) {
        auto values = decoder.decodeRow(raw);
        if (!values) {
            return values.error();
        }
        if (core::isBlankRow(*values)) {
            ++blank_rows;
            continue;
        }
        result.records.push_back(core::pairRecord(header, *values));
    }

    result.total_rows = std::max<int64_t>(static_cast<int64_t>(highest_row) - 1, 0);
    result.total_pages = (result.total_rows + page_size_ - 1) / page_size_;
    result.has_more = window.last - 1 < result.total_rows;
    if (result.has_more) {
        result.next_page = page + 1;
        result.next_page_url = buildPageUrl(result.file, result.sheet, page + 1);
    }

    PAGER_DEBUG("Page {} of '{}'/'{}': {} records, {} blank slots, total_rows={}, {} ms",
                page, handle.file(), handle.sheetName(), result.records.size(), blank_rows,
                result.total_rows, timer.elapsedMs());
    return result;
}

}} // namespace excelpager::paging
