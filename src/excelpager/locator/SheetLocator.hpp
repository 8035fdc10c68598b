#pragma once

#include "excelpager/core/Config.hpp"
#include "excelpager/core/Expected.hpp"
#include "excelpager/core/Path.hpp"
#include "excelpager/reader/XLSXPackage.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace excelpager {
namespace locator {

/**
 * @brief 已定位的工作表
 *
 * 持有本次请求打开的工作簿；析构时释放ZIP句柄。
 */
class SheetHandle {
public:
    SheetHandle(std::string file, std::unique_ptr<reader::XLSXPackage> package, const reader::WorksheetInfo* sheet)
        : file_(std::move(file)), package_(std::move(package)), sheet_(sheet) {}

    SheetHandle(SheetHandle&&) = default;
    SheetHandle& operator=(SheetHandle&&) = default;

    const std::string& file() const { return file_; }
    const std::string& sheetName() const { return sheet_->name; }
    const reader::WorksheetInfo& sheet() const { return *sheet_; }
    reader::XLSXPackage& package() { return *package_; }

private:
    std::string file_;
    std::unique_ptr<reader::XLSXPackage> package_;
    const reader::WorksheetInfo* sheet_;   // 指向 package_ 内部，随 package_ 一起移动
};

/**
 * @brief 工作表定位器：把 (文件名, 工作表名) 解析为可读的数据源
 *
 * 文件名必须是数据目录下的单个路径分量，解析后仍位于数据目录之内。
 * 不做任何缓存，每次调用都重新读取磁盘。
 */
class SheetLocator {
public:
    explicit SheetLocator(core::Path data_dir);

    /**
     * @brief 数据目录中的xlsx文件名（不区分大小写的 .xlsx 后缀，排除 "~$" 锁文件），按字节序排序
     */
    std::vector<std::string> listFiles() const;

    /**
     * @brief 工作簿顺序的工作表名
     * @return FileNotFound；文件无法作为xlsx读取时 FileCorrupted/InvalidWorkbook
     */
    core::Result<std::vector<std::string>> listSheets(const std::string& filename) const;

    /**
     * @brief 打开工作表
     * @param sheet_name 为空时按 mode 选择
     * @return FileNotFound / SheetNotFound / SheetNameRequired / 读取错误
     */
    core::Result<SheetHandle> openSheet(const std::string& filename,
                                        const std::optional<std::string>& sheet_name,
                                        core::SheetSelectionMode mode) const;

    /**
     * @brief 将文件名解析为数据目录中的现存文件
     */
    core::Result<core::Path> resolveFile(const std::string& filename) const;

    const core::Path& dataDir() const { return data_dir_; }

private:
    core::Path data_dir_;

    core::Result<std::unique_ptr<reader::XLSXPackage>> openPackage(const std::string& filename) const;
};

/**
 * @brief 文件名是否为可列出的工作簿（.xlsx 后缀且不是锁文件）
 */
bool isWorkbookName(const std::string& filename);

}} // namespace excelpager::locator
