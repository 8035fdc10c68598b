/**
 * @file XLSXPackage.cpp
 * @brief XLSX包结构解析与部件读取
 */

#include "excelpager/reader/XLSXPackage.hpp"
#include "excelpager/reader/RelationshipsParser.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"

namespace excelpager {
namespace reader {

namespace {

const char* const kOfficeDocumentSuffix = "/officeDocument";
const char* const kSharedStringsSuffix = "/sharedStrings";
const char* const kStylesSuffix = "/styles";

bool endsWith(const std::string& value, const char* suffix) {
    std::string_view tail(suffix);
    return value.size() >= tail.size() &&
           value.compare(value.size() - tail.size(), tail.size(), tail) == 0;
}

std::string directoryOf(const std::string& part) {
    auto slash = part.rfind('/');
    return slash == std::string::npos ? std::string() : part.substr(0, slash + 1);
}

std::string relationshipsPathFor(const std::string& part) {
    auto slash = part.rfind('/');
    if (slash == std::string::npos) {
        return "_rels/" + part + ".rels";
    }
    return part.substr(0, slash + 1) + "_rels/" + part.substr(slash + 1) + ".rels";
}

} // namespace

XLSXPackage::XLSXPackage(const core::Path& path)
    : path_(path)
    , zip_(std::make_unique<archive::ZipReader>(path)) {}

XLSXPackage::~XLSXPackage() {
    if (zip_ && zip_->isOpen()) {
        archive::ZipError result = zip_->close();
        if (archive::isError(result)) {
            READER_WARN("Failed to close {}: {}", path_.string(), archive::toString(result));
        }
    }
}

core::Result<std::unique_ptr<XLSXPackage>> XLSXPackage::open(const core::Path& path) {
    if (!path.isFile()) {
        return core::Error(core::ErrorCode::FileNotFound, "File not found", path.string());
    }

    std::unique_ptr<XLSXPackage> package(new XLSXPackage(path));

    archive::ZipError zip_result = package->zip_->open();
    if (archive::isError(zip_result)) {
        READER_ERROR("无法打开XLSX文件: {} ({})", path.string(), archive::toString(zip_result));
        core::ErrorCode code = zip_result == archive::ZipError::IoFail ? core::ErrorCode::FileAccessDenied
                                                                       : core::ErrorCode::FileCorrupted;
        return core::Error(code, std::string("Not a readable xlsx package: ") + archive::toString(zip_result),
                           path.string());
    }

    auto structure = package->loadStructure();
    if (!structure) {
        return structure.error();
    }

    READER_DEBUG("Opened {} with {} sheets (date1904={})", path.string(), package->sheets_.size(),
                 package->date1904_);
    return std::move(package);
}

core::VoidResult XLSXPackage::extractPart(const std::string& part, std::string& content,
                                          core::ErrorCode missing_code) {
    archive::ZipError result = zip_->extractFile(part, content);
    if (result == archive::ZipError::FileNotFound) {
        return core::Error(missing_code, "Missing package part " + part, path_.string());
    }
    if (archive::isError(result)) {
        return core::Error(core::ErrorCode::ZipError,
                           "Failed to extract " + part + ": " + archive::toString(result), path_.string());
    }
    return {};
}

std::string XLSXPackage::findOfficeDocument() {
    std::string content;
    if (archive::isError(zip_->extractFile("_rels/.rels", content))) {
        READER_DEBUG("No package relationships in {}, using default workbook path", path_.string());
        return "xl/workbook.xml";
    }

    RelationshipsParser rels;
    if (!rels.parse(content)) {
        READER_WARN("Malformed _rels/.rels in {}: {}", path_.string(), rels.getErrorMessage());
        return "xl/workbook.xml";
    }
    for (const auto& rel : rels.getRelationships()) {
        if (endsWith(rel.type, kOfficeDocumentSuffix) && rel.target_mode != "External") {
            return RelationshipsParser::resolvePartPath("", rel.target);
        }
    }
    return "xl/workbook.xml";
}

core::VoidResult XLSXPackage::loadStructure() {
    workbook_path_ = findOfficeDocument();
    const std::string base_dir = directoryOf(workbook_path_);

    // 工作簿关系（缺失时工作表路径按默认规则推断）
    RelationshipsParser rels;
    std::string content;
    archive::ZipError rels_result = zip_->extractFile(relationshipsPathFor(workbook_path_), content);
    if (archive::isSuccess(rels_result)) {
        if (!rels.parse(content)) {
            return core::Error(core::ErrorCode::InvalidWorkbook,
                               "Malformed workbook relationships: " + rels.getErrorMessage(), path_.string());
        }
        for (const auto& rel : rels.getRelationships()) {
            if (rel.target_mode == "External") {
                continue;
            }
            if (endsWith(rel.type, kSharedStringsSuffix)) {
                shared_strings_path_ = RelationshipsParser::resolvePartPath(base_dir, rel.target);
            } else if (endsWith(rel.type, kStylesSuffix)) {
                styles_path_ = RelationshipsParser::resolvePartPath(base_dir, rel.target);
            }
        }
    } else if (rels_result != archive::ZipError::FileNotFound) {
        return core::Error(core::ErrorCode::ZipError,
                           std::string("Failed to read workbook relationships: ") + archive::toString(rels_result),
                           path_.string());
    }

    // 部件存在性以ZIP目录为准
    if (!shared_strings_path_.empty() && archive::isError(zip_->fileExists(shared_strings_path_))) {
        READER_DEBUG("Shared strings part {} listed but missing", shared_strings_path_);
        shared_strings_path_.clear();
    }
    if (!styles_path_.empty() && archive::isError(zip_->fileExists(styles_path_))) {
        styles_path_.clear();
    }

    auto extracted = extractPart(workbook_path_, content, core::ErrorCode::InvalidWorkbook);
    if (!extracted) {
        return extracted;
    }

    WorkbookParser workbook;
    workbook.setBaseDirectory(base_dir);
    workbook.setRelationships(rels.getTargetMap());
    if (!workbook.parse(content)) {
        return core::Error(core::ErrorCode::InvalidWorkbook,
                           "Malformed workbook: " + workbook.getErrorMessage(), path_.string());
    }

    date1904_ = workbook.isDate1904();
    sheets_ = workbook.takeWorksheets();
    return {};
}

const WorksheetInfo* XLSXPackage::findSheet(const std::string& name) const {
    for (const auto& sheet : sheets_) {
        if (sheet.name == name) {
            return &sheet;
        }
    }
    return nullptr;
}

core::Result<const StylesParser*> XLSXPackage::styles() {
    if (styles_loaded_) {
        return static_cast<const StylesParser*>(styles_.get());
    }
    styles_loaded_ = true;

    if (styles_path_.empty()) {
        READER_DEBUG("No styles part in {}, date formats disabled", path_.string());
        return static_cast<const StylesParser*>(nullptr);
    }

    std::string content;
    auto extracted = extractPart(styles_path_, content, core::ErrorCode::InvalidWorkbook);
    if (!extracted) {
        return extracted.error();
    }

    auto parser = std::make_unique<StylesParser>();
    if (!parser->parse(content)) {
        return core::Error(core::ErrorCode::XmlParseError,
                           "Malformed styles: " + parser->getErrorMessage(), path_.string());
    }
    READER_DEBUG("Loaded {} cell formats from {}", parser->getCellXfCount(), styles_path_);
    styles_ = std::move(parser);
    return static_cast<const StylesParser*>(styles_.get());
}

core::Result<std::unique_ptr<WorksheetRowReader>> XLSXPackage::openWorksheet(const WorksheetInfo& sheet,
                                                                             const core::CancellationToken& token) {
    std::unique_ptr<archive::EntryStream> stream;
    archive::ZipError result = zip_->openEntry(sheet.worksheet_path, stream);
    if (result == archive::ZipError::FileNotFound) {
        return core::Error(core::ErrorCode::InvalidWorkbook,
                           "Worksheet part " + sheet.worksheet_path + " for sheet '" + sheet.name + "' is missing",
                           path_.string());
    }
    if (archive::isError(result)) {
        return core::Error(core::ErrorCode::ZipError,
                           "Failed to open worksheet " + sheet.worksheet_path + ": " + archive::toString(result),
                           path_.string());
    }

    auto reader = std::make_unique<WorksheetRowReader>(std::move(stream), token);
    auto primed = reader->prime();
    if (!primed) {
        return primed.error();
    }
    return std::move(reader);
}

core::Result<std::unique_ptr<SharedStringsParser>> XLSXPackage::loadSharedStrings(
        const std::unordered_set<uint32_t>& wanted, const core::CancellationToken& token) {
    auto parser = std::make_unique<SharedStringsParser>();
    if (wanted.empty()) {
        return std::move(parser);
    }
    if (shared_strings_path_.empty()) {
        return core::Error(core::ErrorCode::InvalidCellValue,
                           "Cells reference shared strings but the workbook has none", path_.string());
    }

    std::unique_ptr<archive::EntryStream> stream;
    archive::ZipError result = zip_->openEntry(shared_strings_path_, stream);
    if (archive::isError(result)) {
        return core::Error(core::ErrorCode::ZipError,
                           "Failed to open " + shared_strings_path_ + ": " + archive::toString(result),
                           path_.string());
    }

    parser->setWantedIndices(wanted);
    if (!parser->parseStream(*stream, &token)) {
        if (parser->wasCancelled()) {
            return core::Error(core::ErrorCode::Cancelled, parser->getErrorMessage(), path_.string());
        }
        return core::Error(core::ErrorCode::XmlParseError,
                           "Failed to parse shared strings: " + parser->getErrorMessage(), path_.string());
    }
    READER_DEBUG("Loaded {} of {} wanted shared strings (parsed {})", parser->getStoredCount(), wanted.size(),
                 parser->getParsedCount());
    return std::move(parser);
}

}} // namespace excelpager::reader
