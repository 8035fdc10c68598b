#pragma once

#include "excelpager/core/Path.hpp"
#include "excelpager/archive/ZipError.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace excelpager {
namespace archive {

class ZipReader;

/**
 * @brief ZIP条目的拉取式读取流
 *
 * 由 ZipReader::openEntry 创建，析构时关闭条目。
 * 同一个 ZipReader 同一时刻只能有一个打开的条目。
 */
class EntryStream {
public:
    ~EntryStream();

    EntryStream(const EntryStream&) = delete;
    EntryStream& operator=(const EntryStream&) = delete;

    /**
     * @brief 读取下一块解压后的数据
     * @param buffer 输出缓冲区
     * @param capacity 缓冲区大小
     * @param bytes_read 实际读取字节数，0 表示条目结束
     */
    ZipError read(uint8_t* buffer, size_t capacity, size_t& bytes_read);

    const std::string& path() const { return path_; }
    uint64_t uncompressedSize() const { return uncompressed_size_; }

private:
    friend class ZipReader;
    EntryStream(ZipReader* owner, std::string path, uint64_t uncompressed_size);

    ZipReader* owner_;
    std::string path_;
    uint64_t uncompressed_size_;
    uint64_t total_read_ = 0;
    bool finished_ = false;
};

/**
 * @brief ZIP读取器 - 基于minizip-ng
 *
 * 特性：
 * - 条目信息缓存
 * - 小条目整体提取（工作簿、关系、样式）
 * - 大条目流式读取（工作表、共享字符串）
 */
class ZipReader {
public:
    explicit ZipReader(const core::Path& path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * 打开ZIP文件进行读取
     */
    ZipError open();

    /**
     * 关闭ZIP文件（仍有打开的 EntryStream 时不允许关闭）
     */
    ZipError close();

    bool isOpen() const { return is_open_; }

    ZipError fileExists(std::string_view internal_path) const;

    /**
     * 提取条目到字符串（适用于小条目）
     */
    ZipError extractFile(std::string_view internal_path, std::string& content);

    /**
     * 打开条目进行流式读取
     * @param internal_path ZIP内部路径
     * @param stream 输出的流对象
     */
    ZipError openEntry(std::string_view internal_path, std::unique_ptr<EntryStream>& stream);

private:
    friend class EntryStream;

    void* unzip_handle_ = nullptr;
    core::Path filepath_;
    bool is_open_ = false;
    bool entry_open_ = false;
    mutable std::mutex mutex_;

    mutable std::unordered_set<std::string> entry_cache_;  // 条目路径（目录除外）
    mutable bool cache_initialized_ = false;

    ZipError initializeReader();
    void cleanup();
    void buildEntryCache() const;
    bool locateEntry(std::string_view path) const;

    // EntryStream 使用
    int32_t readEntry(uint8_t* buffer, int32_t size);
    int32_t closeEntry();  // 返回 minizip 状态码（CRC 校验在此完成）
};

}} // namespace excelpager::archive
