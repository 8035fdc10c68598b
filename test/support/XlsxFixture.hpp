#pragma once

#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace excelpager {
namespace test {

/**
 * @brief 测试用临时目录，析构时递归删除
 */
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

    /**
     * @brief 写入普通文件（非xlsx内容）
     */
    void writeText(const std::string& name, const std::string& content) const;

private:
    std::filesystem::path path_;
};

// ========== 单元格与行的XML片段 ==========

std::string xmlEscape(const std::string& text);

std::string inlineStr(const std::string& ref, const std::string& text);
std::string number(const std::string& ref, const std::string& literal, int style = -1);
std::string shared(const std::string& ref, int index);
std::string boolean(const std::string& ref, bool value);
std::string errorCell(const std::string& ref, const std::string& text);
std::string formulaStr(const std::string& ref, const std::string& formula, const std::string& cached);
std::string isoDate(const std::string& ref, const std::string& text);
std::string typed(const std::string& ref, const std::string& type, const std::string& value);

std::string row(int number, std::initializer_list<std::string> cells);
std::string row(int number, const std::vector<std::string>& cells);

/**
 * @brief 完整的工作表XML
 * @param dimension 为空时不输出 <dimension>
 */
std::string worksheetXml(const std::string& sheet_data, const std::string& dimension = "");

/**
 * @brief 生成最小但结构完整的xlsx文件（minizip-ng 写入）
 */
class XlsxBuilder {
public:
    XlsxBuilder& addSheet(const std::string& name, const std::string& worksheet_xml);
    XlsxBuilder& addSheet(const std::string& name, const std::string& worksheet_xml, bool hidden);
    XlsxBuilder& setSharedStrings(const std::vector<std::string>& strings);
    XlsxBuilder& setStylesXml(const std::string& styles_xml);
    XlsxBuilder& setDate1904(bool date1904);

    /**
     * @brief 直接写入/覆盖某个包部件（用于构造损坏的文件）
     */
    XlsxBuilder& setPart(const std::string& path, const std::string& content);

    /**
     * @brief 不写入某个包部件
     */
    XlsxBuilder& removePart(const std::string& path);

    /**
     * @brief 含一个日期格式 (xf 1 = numFmtId 14) 和一个自定义格式 (xf 2 = "0.00") 的样式表
     */
    static std::string dateStylesXml();

    bool write(const std::string& file) const;

private:
    struct SheetEntry {
        std::string name;
        std::string xml;
        bool hidden = false;
    };

    std::vector<SheetEntry> sheets_;
    std::optional<std::vector<std::string>> shared_strings_;
    std::optional<std::string> styles_xml_;
    bool date1904_ = false;
    std::map<std::string, std::string> overrides_;
    std::vector<std::string> removed_;

    std::map<std::string, std::string> buildParts() const;
};

/**
 * @brief 将任意 path -> content 写为ZIP文件
 */
bool writeZip(const std::string& file, const std::map<std::string, std::string>& entries);

}} // namespace excelpager::test
