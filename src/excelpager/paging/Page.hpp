#pragma once

#include "excelpager/core/CellValue.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace excelpager {
namespace paging {

/**
 * @brief 一页数据及分页元信息（每次请求重新计算，不持久化）
 */
struct Page {
    std::string file;
    std::optional<std::string> sheet;       // 仅工作表寻址形式的请求带有
    int64_t page = 1;
    int64_t per_page = 0;
    std::vector<core::Record> records;      // 已去除空白行
    int64_t total_rows = 0;                 // 最大物理行号 - 1，不小于 0
    int64_t total_pages = 0;
    bool has_more = false;
    std::optional<int64_t> next_page;
    std::optional<std::string> next_page_url;
};

}} // namespace excelpager::paging
