#include "excelpager/archive/ZipReader.hpp"
#include "excelpager/core/Constants.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <vector>

namespace excelpager {
namespace archive {

// EntryStream

EntryStream::EntryStream(ZipReader* owner, std::string path, uint64_t uncompressed_size)
    : owner_(owner), path_(std::move(path)), uncompressed_size_(uncompressed_size) {
}

EntryStream::~EntryStream() {
    if (owner_ && !finished_) {
        owner_->closeEntry();
    }
}

ZipError EntryStream::read(uint8_t* buffer, size_t capacity, size_t& bytes_read) {
    bytes_read = 0;
    if (finished_) {
        return ZipError::Ok;
    }
    if (!buffer || capacity == 0) {
        return ZipError::InvalidParameter;
    }

    int32_t chunk = static_cast<int32_t>(capacity > static_cast<size_t>(INT32_MAX) ? INT32_MAX : capacity);
    int32_t result = owner_->readEntry(buffer, chunk);
    if (result < 0) {
        ARCHIVE_ERROR("Failed to read entry {}: error {}", path_, result);
        finished_ = true;
        owner_->closeEntry();
        return result == MZ_CRC_ERROR || result == MZ_FORMAT_ERROR || result == MZ_DATA_ERROR
            ? ZipError::BadFormat : ZipError::IoFail;
    }

    if (result == 0) {
        finished_ = true;
        int32_t close_result = owner_->closeEntry();
        if (close_result != MZ_OK) {
            ARCHIVE_ERROR("Entry {} failed integrity check on close: error {}", path_, close_result);
            return ZipError::BadFormat;
        }
        ARCHIVE_DEBUG("Streamed entry {}, {} bytes", path_, total_read_);
        return ZipError::Ok;
    }

    total_read_ += static_cast<uint64_t>(result);
    bytes_read = static_cast<size_t>(result);
    return ZipError::Ok;
}

// 构造/析构

ZipReader::ZipReader(const core::Path& path)
    : filepath_(path) {
}

ZipReader::~ZipReader() {
    cleanup();
}

// 文件操作

ZipError ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
    return initializeReader();
}

ZipError ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry_open_) {
        ARCHIVE_WARN("Closing zip {} while an entry stream is still open", filepath_.string());
        return ZipError::EntryBusy;
    }
    cleanup();
    return ZipError::Ok;
}

// 条目查询

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        return ZipError::NotOpen;
    }

    buildEntryCache();

    if (entry_cache_.find(std::string(internal_path)) != entry_cache_.end()) {
        return ZipError::Ok;
    }
    return ZipError::FileNotFound;
}

// 读取操作

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::unique_ptr<EntryStream> stream;
    ZipError result = openEntry(internal_path, stream);
    if (isError(result)) {
        return result;
    }

    content.clear();
    if (stream->uncompressedSize() > 0) {
        content.reserve(static_cast<size_t>(stream->uncompressedSize()));
    }

    std::vector<uint8_t> buffer(core::Constants::kIOBufferSize);
    for (;;) {
        size_t bytes_read = 0;
        result = stream->read(buffer.data(), buffer.size(), bytes_read);
        if (isError(result)) {
            return result;
        }
        if (bytes_read == 0) {
            break;
        }
        content.append(reinterpret_cast<const char*>(buffer.data()), bytes_read);
    }

    ARCHIVE_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, content.size());
    return ZipError::Ok;
}

ZipError ZipReader::openEntry(std::string_view internal_path, std::unique_ptr<EntryStream>& stream) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }
    if (entry_open_) {
        ARCHIVE_ERROR("Cannot open {}: another entry is still open", internal_path);
        return ZipError::EntryBusy;
    }

    if (!locateEntry(internal_path)) {
        ARCHIVE_DEBUG("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }

    mz_zip_file* info = nullptr;
    if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info) {
        return ZipError::BadFormat;
    }
    uint64_t uncompressed_size = info->uncompressed_size > 0
        ? static_cast<uint64_t>(info->uncompressed_size) : 0;

    int32_t result = mz_zip_reader_entry_open(unzip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {}: error {}", internal_path, result);
        return ZipError::BadFormat;
    }

    entry_open_ = true;
    stream.reset(new EntryStream(this, std::string(internal_path), uncompressed_size));
    return ZipError::Ok;
}

// 内部辅助方法

ZipError ZipReader::initializeReader() {
    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_DEBUG("Failed to open zip file for reading: {}, error: {}", filepath_.string(), result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return result == MZ_OPEN_ERROR ? ZipError::IoFail : ZipError::BadFormat;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for reading: {}", filepath_.string());
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        if (entry_open_) {
            mz_zip_reader_entry_close(unzip_handle_);
            entry_open_ = false;
        }
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }

    is_open_ = false;
    entry_cache_.clear();
    cache_initialized_ = false;
}

void ZipReader::buildEntryCache() const {
    if (!unzip_handle_ || cache_initialized_ || entry_open_) {
        return;
    }

    entry_cache_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        cache_initialized_ = true;
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info) {
            if (file_info->filename && file_info->filename[0] != '\0') {
                std::string path = file_info->filename;
                if (path.back() != '/') {
                    entry_cache_.insert(std::move(path));
                }
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    cache_initialized_ = true;
    ARCHIVE_DEBUG("Built entry cache with {} entries", entry_cache_.size());
}

bool ZipReader::locateEntry(std::string_view path) const {
    if (!unzip_handle_) {
        return false;
    }

    std::string path_str(path);
    int32_t result = mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 1);
    return result == MZ_OK;
}

int32_t ZipReader::readEntry(uint8_t* buffer, int32_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!unzip_handle_ || !entry_open_) {
        return MZ_PARAM_ERROR;
    }
    return mz_zip_reader_entry_read(unzip_handle_, buffer, size);
}

int32_t ZipReader::closeEntry() {
    std::lock_guard<std::mutex> lock(mutex_);
    int32_t result = MZ_OK;
    if (unzip_handle_ && entry_open_) {
        result = mz_zip_reader_entry_close(unzip_handle_);
    }
    entry_open_ = false;
    return result;
}

}} // namespace excelpager::archive
