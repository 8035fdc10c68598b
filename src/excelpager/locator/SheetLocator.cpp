#include "excelpager/locator/SheetLocator.hpp"
#include "excelpager/core/Constants.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>

namespace excelpager {
namespace locator {

bool isWorkbookName(const std::string& filename) {
    const std::string prefix = core::Constants::kLockFilePrefix;
    const std::string extension = core::Constants::kWorkbookExtension;

    if (filename.size() < extension.size() || filename.compare(0, prefix.size(), prefix) == 0) {
        return false;
    }
    return std::equal(extension.rbegin(), extension.rend(), filename.rbegin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

SheetLocator::SheetLocator(core::Path data_dir) : data_dir_(std::move(data_dir)) {}

std::vector<std::string> SheetLocator::listFiles() const {
    std::vector<std::string> files;
    for (const auto& entry : data_dir_.listDirectory()) {
        std::string name = entry.filename();
        if (isWorkbookName(name) && entry.isFile()) {
            files.push_back(std::move(name));
        }
    }
    std::sort(files.begin(), files.end());
    LOCATOR_DEBUG("Listed {} workbooks in {}", files.size(), data_dir_.string());
    return files;
}

core::Result<core::Path> SheetLocator::resolveFile(const std::string& filename) const {
    // 只接受单个路径分量
    if (filename.empty() || filename == "." || filename == ".." ||
        filename.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        LOCATOR_WARN("Rejected file name '{}'", filename);
        return core::Error(core::ErrorCode::FileNotFound, "File not found", filename);
    }

    core::Path path = data_dir_ / filename;
    if (!path.isWithin(data_dir_)) {
        LOCATOR_WARN("File name '{}' escapes the data directory", filename);
        return core::Error(core::ErrorCode::FileNotFound, "File not found", filename);
    }
    if (!path.isFile()) {
        return core::Error(core::ErrorCode::FileNotFound, "File not found", filename);
    }
    return path;
}

core::Result<std::unique_ptr<reader::XLSXPackage>> SheetLocator::openPackage(const std::string& filename) const {
    auto path = resolveFile(filename);
    if (!path) {
        return path.error();
    }

    auto package = reader::XLSXPackage::open(*path);
    if (!package) {
        LOCATOR_ERROR("Cannot open workbook '{}': {}", filename, package.error().fullMessage());
    }
    return package;
}

core::Result<std::vector<std::string>> SheetLocator::listSheets(const std::string& filename) const {
    auto package = openPackage(filename);
    if (!package) {
        return package.error();
    }

    std::vector<std::string> names;
    for (const auto& sheet : (*package)->sheets()) {
        names.push_back(sheet.name);
    }
    return names;
}

core::Result<SheetHandle> SheetLocator::openSheet(const std::string& filename,
                                                  const std::optional<std::string>& sheet_name,
                                                  core::SheetSelectionMode mode) const {
    auto opened = openPackage(filename);
    if (!opened) {
        return opened.error();
    }
    std::unique_ptr<reader::XLSXPackage> package = std::move(opened).value();
    const auto& sheets = package->sheets();

    const reader::WorksheetInfo* sheet = nullptr;
    if (sheet_name) {
        sheet = package->findSheet(*sheet_name);
        if (!sheet) {
            return core::Error(core::ErrorCode::SheetNotFound,
                               "Sheet '" + *sheet_name + "' not found", filename);
        }
    } else if (sheets.empty()) {
        return core::Error(core::ErrorCode::InvalidWorkbook, "Workbook has no sheets", filename);
    } else if (sheets.size() == 1) {
        sheet = &sheets.front();
    } else if (mode == core::SheetSelectionMode::FirstSheet) {
        sheet = &sheets.front();
        LOCATOR_WARN("Workbook '{}' has {} sheets, using the first one ('{}')",
                     filename, sheets.size(), sheet->name);
    } else {
        return core::Error(core::ErrorCode::SheetNameRequired,
                           "Sheet name required: workbook has " + std::to_string(sheets.size()) + " sheets",
                           filename);
    }

    LOCATOR_DEBUG("Resolved '{}' sheet '{}' to {}", filename, sheet->name, sheet->worksheet_path);
    return SheetHandle(filename, std::move(package), sheet);
}

}} // namespace excelpager::locator
