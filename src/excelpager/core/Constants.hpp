#pragma once

#include <cstddef>
#include <cstdint>

namespace excelpager {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // I/O 缓冲区大小（ZIP条目按此大小分块解压并喂给XML解析器）
    static constexpr size_t kIOBufferSize = 8192;

    // Excel 工作表最大行/列
    static constexpr int64_t kMaxRows = 1048576;
    static constexpr int kMaxColumns = 16384;

    // 锁文件前缀与工作簿扩展名
    static constexpr const char* kLockFilePrefix = "~$";
    static constexpr const char* kWorkbookExtension = ".xlsx";

    // 默认每页行数
    static constexpr int64_t kDefaultPageSize = 1000;
};

} // namespace core
} // namespace excelpager
