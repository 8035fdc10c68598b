#pragma once

#include "excelpager/archive/ZipReader.hpp"
#include "excelpager/core/CancellationToken.hpp"
#include "excelpager/core/Expected.hpp"
#include "excelpager/core/Path.hpp"
#include "excelpager/reader/SharedStringsParser.hpp"
#include "excelpager/reader/StylesParser.hpp"
#include "excelpager/reader/WorkbookParser.hpp"
#include "excelpager/reader/WorksheetRowReader.hpp"
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace excelpager {
namespace reader {

/**
 * @brief 一个已打开的XLSX包（单次请求内使用）
 *
 * 打开时解析包关系、工作簿关系和工作簿，样式在第一次需要时解析。
 * 共享字符串不在这里常驻，由调用方按页加载。
 *
 * 持有ZIP句柄；由它创建的行游标与条目流不得比它活得更久。
 * 同一时间只能打开一个条目。
 */
class XLSXPackage {
public:
    ~XLSXPackage();

    XLSXPackage(const XLSXPackage&) = delete;
    XLSXPackage& operator=(const XLSXPackage&) = delete;

    /**
     * @brief 打开工作簿
     * @return 文件不存在时 FileNotFound；不是ZIP时 FileCorrupted；
     *         缺少或无法解析工作簿部件时 InvalidWorkbook
     */
    static core::Result<std::unique_ptr<XLSXPackage>> open(const core::Path& path);

    const core::Path& path() const { return path_; }

    /**
     * @brief 工作簿顺序的工作表列表
     */
    const std::vector<WorksheetInfo>& sheets() const { return sheets_; }

    const WorksheetInfo* findSheet(const std::string& name) const;

    bool isDate1904() const { return date1904_; }

    bool hasSharedStrings() const { return !shared_strings_path_.empty(); }

    /**
     * @brief 样式表（懒加载；工作簿没有样式部件时返回 nullptr）
     */
    core::Result<const StylesParser*> styles();

    /**
     * @brief 打开工作表并预读到 sheetData
     */
    core::Result<std::unique_ptr<WorksheetRowReader>> openWorksheet(const WorksheetInfo& sheet,
                                                                    const core::CancellationToken& token);

    /**
     * @brief 流式加载共享字符串表中被引用的条目
     * @param wanted 需要的索引；为空时不读取部件
     */
    core::Result<std::unique_ptr<SharedStringsParser>> loadSharedStrings(const std::unordered_set<uint32_t>& wanted,
                                                                         const core::CancellationToken& token);

private:
    explicit XLSXPackage(const core::Path& path);

    core::Path path_;
    std::unique_ptr<archive::ZipReader> zip_;
    std::vector<WorksheetInfo> sheets_;
    bool date1904_ = false;
    std::string workbook_path_;
    std::string shared_strings_path_;
    std::string styles_path_;
    std::unique_ptr<StylesParser> styles_;
    bool styles_loaded_ = false;

    core::VoidResult loadStructure();
    core::VoidResult extractPart(const std::string& part, std::string& content, core::ErrorCode missing_code);
    std::string findOfficeDocument();
};

}} // namespace excelpager::reader
