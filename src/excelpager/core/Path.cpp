#include "excelpager/core/Path.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#include <utf8.h>
#endif

namespace excelpager {
namespace core {

namespace {

std::filesystem::path toNative(const Path& path) {
#ifdef _WIN32
    return std::filesystem::path(path.getWidePath());
#else
    return std::filesystem::path(path.string());
#endif
}

Path fromNative(const std::filesystem::path& native) {
#ifdef _WIN32
    std::string utf8_path;
    std::wstring wide = native.wstring();
    utf8::utf16to8(wide.begin(), wide.end(), std::back_inserter(utf8_path));
    return Path(utf8_path);
#else
    return Path(native.string());
#endif
}

} // namespace

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : Path(std::string(path ? path : "")) {}

#ifdef _WIN32
std::wstring Path::getWidePath() const {
    if (utf8_path_.empty()) return std::wstring();

    try {
        std::wstring result;
        utf8::utf8to16(utf8_path_.begin(), utf8_path_.end(), std::back_inserter(result));
        return result;
    } catch (const utf8::exception&) {
        int size_needed = MultiByteToWideChar(CP_UTF8, 0, utf8_path_.c_str(), -1, NULL, 0);
        if (size_needed == 0) return std::wstring();

        std::wstring result(size_needed - 1, 0);
        MultiByteToWideChar(CP_UTF8, 0, utf8_path_.c_str(), -1, &result[0], size_needed);
        return result;
    }
}
#endif

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::exists(toNative(*this), ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::is_regular_file(toNative(*this), ec);
}

bool Path::isDirectory() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return std::filesystem::is_directory(toNative(*this), ec);
}

uintmax_t Path::fileSize() const {
    if (utf8_path_.empty()) return 0;

    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(toNative(*this), ec);
    if (ec) {
        UTILS_DEBUG("Filesystem error getting file size '{}': {}", utf8_path_, ec.message());
        return 0;
    }
    return size;
}

std::string Path::filename() const {
    return fromNative(toNative(*this).filename()).string();
}

Path Path::operator/(const std::string& child) const {
    return fromNative(toNative(*this) / toNative(Path(child)));
}

bool Path::isWithin(const Path& root) const {
    if (utf8_path_.empty() || root.empty()) return false;

    std::error_code ec;
    auto base = std::filesystem::weakly_canonical(toNative(root), ec);
    if (ec) {
        UTILS_DEBUG("Cannot resolve root '{}': {}", root.utf8_path_, ec.message());
        return false;
    }
    auto target = std::filesystem::weakly_canonical(toNative(*this), ec);
    if (ec) {
        UTILS_DEBUG("Cannot resolve path '{}': {}", utf8_path_, ec.message());
        return false;
    }

    auto relative = target.lexically_relative(base);
    if (relative.empty() || relative == std::filesystem::path(".")) {
        return false;
    }
    return *relative.begin() != std::filesystem::path("..");
}

std::vector<Path> Path::listDirectory() const {
    std::vector<Path> entries;
    if (!isDirectory()) return entries;

    std::error_code ec;
    std::filesystem::directory_iterator it(toNative(*this), ec);
    if (ec) {
        UTILS_WARN("Cannot list directory '{}': {}", utf8_path_, ec.message());
        return entries;
    }
    const std::filesystem::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            UTILS_WARN("Error while listing directory '{}': {}", utf8_path_, ec.message());
            break;
        }
        entries.push_back(fromNative(it->path()));
    }
    return entries;
}

} // namespace core
} // namespace excelpager
