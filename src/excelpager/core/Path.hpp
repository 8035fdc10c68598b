#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <ostream>

#ifdef _WIN32
#include <utf8.h>
#endif

namespace excelpager {
namespace core {

/**
 * @brief UTF-8路径处理类，封装跨平台文件路径操作
 *
 * 在Windows下通过utf8cpp将UTF-8转换为UTF-16，在其他平台直接使用UTF-8。
 * 数据目录沙箱检查（isWithin）也在这里完成。
 */
class Path {
private:
    std::string utf8_path_;

public:
    explicit Path(const std::string& path);
    explicit Path(const char* path);
    Path() = default;

    const std::string& string() const { return utf8_path_; }
    const char* c_str() const { return utf8_path_.c_str(); }
    bool empty() const { return utf8_path_.empty(); }

    // 文件操作
    bool exists() const;
    bool isFile() const;
    bool isDirectory() const;

    /**
     * @brief 获取文件大小
     * @return 文件大小（字节），失败返回0
     */
    uintmax_t fileSize() const;

    /**
     * @brief 最后一个路径分量（不含目录）
     */
    std::string filename() const;

    /**
     * @brief 拼接子路径
     */
    Path operator/(const std::string& child) const;

    /**
     * @brief 解析后的路径是否严格位于 root 目录之内
     *
     * 两边都先做 weakly_canonical（解析 ".."、符号链接），
     * 路径等于 root 本身或逃逸到 root 之外都返回 false。
     */
    bool isWithin(const Path& root) const;

    /**
     * @brief 列出目录下的直接子项（非递归）
     * @return 失败或不是目录时返回空列表
     */
    std::vector<Path> listDirectory() const;

#ifdef _WIN32
    /**
     * @brief 获取Windows宽字符路径
     */
    std::wstring getWidePath() const;
#endif

    bool operator==(const Path& other) const { return utf8_path_ == other.utf8_path_; }
    bool operator!=(const Path& other) const { return utf8_path_ != other.utf8_path_; }
    bool operator<(const Path& other) const { return utf8_path_ < other.utf8_path_; }

    friend std::ostream& operator<<(std::ostream& os, const Path& path) {
        return os << path.utf8_path_;
    }
};

} // namespace core
} // namespace excelpager
