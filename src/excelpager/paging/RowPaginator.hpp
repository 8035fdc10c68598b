#pragma once

#include "excelpager/core/CancellationToken.hpp"
#include "excelpager/core/Config.hpp"
#include "excelpager/core/Expected.hpp"
#include "excelpager/locator/SheetLocator.hpp"
#include "excelpager/paging/Page.hpp"
#include <cstdint>
#include <string>

namespace excelpager {
namespace paging {

/**
 * @brief 行分页器
 *
 * 第1行为表头，数据行从第2行开始。第 page 页覆盖物理行
 * [(page-1)*page_size + 2, page*page_size + 1]：
 * - 窗口之前的行只解析结构，不物化值、不查共享字符串
 * - 窗口内的空白行（含XML中缺失的行）占用位置，但不输出
 * - 窗口之后的行只计数（RowCountMode::Dimension 且有 <dimension> 时不再读取）
 *
 * 任何读取或解码错误都使整个请求失败，不返回部分结果。
 */
class RowPaginator {
public:
    RowPaginator(int64_t page_size, core::RowCountMode count_mode);

    /**
     * @brief 读取一页
     * @param sheet_addressed 请求是否显式指定了工作表（决定 sheet 字段和下一页链接的形式）
     * @return page < 1 时 InvalidArgument
     */
    core::Result<Page> fetchPage(locator::SheetHandle& handle, int64_t page, bool sheet_addressed,
                                 const core::CancellationToken& token = core::CancellationToken()) const;

    int64_t pageSize() const { return page_size_; }
    core::RowCountMode countMode() const { return count_mode_; }

    /**
     * @brief 下一页链接，文件名与工作表名按路径分量编码
     */
    static std::string buildPageUrl(const std::string& file, const std::optional<std::string>& sheet,
                                    int64_t page);

private:
    int64_t page_size_;
    core::RowCountMode count_mode_;
};

}} // namespace excelpager::paging
