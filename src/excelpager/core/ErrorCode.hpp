#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace excelpager {
namespace core {

/**
 * @brief ExcelPager统一错误码
 *
 * 设计原则：
 * - 核心路径（定位、分页、读取）一律通过 Result<T> 返回错误码
 * - 仅在启动阶段（配置加载）使用异常
 * - 每一类错误对应边界层的一个 HTTP 状态码（见 httpStatusFor）
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,
    Cancelled = 4,

    // 文件/工作表定位错误 (20-39)
    FileNotFound = 20,
    FileAccessDenied = 21,
    FileCorrupted = 22,
    FileReadError = 24,
    SheetNotFound = 25,
    SheetNameRequired = 26,

    // Excel格式错误 (40-59)
    InvalidWorkbook = 40,
    InvalidWorksheet = 41,
    InvalidCellReference = 42,
    InvalidCellValue = 43,

    // ZIP/XML处理错误 (60-79)
    ZipError = 60,
    XmlParseError = 61,
    XmlMissingElement = 63,

    // 服务边界错误 (90-99)
    Unauthorized = 90,
    RateLimited = 91,
    RouteNotFound = 92,
    MethodNotAllowed = 93,
    InvalidConfig = 94
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 错误分类
 *
 * NotFound / InvalidParameter / Unreadable / ReadFailure 对应核心的四种失败，
 * 其余三类只在服务边界产生。
 */
enum class ErrorKind {
    None,
    NotFound,
    InvalidParameter,
    Unreadable,
    ReadFailure,
    Cancelled,
    Unauthorized,
    RateLimited,
    MethodNotAllowed,
    Internal
};

ErrorKind kindOf(ErrorCode code) noexcept;

/**
 * @brief 错误码对应的 HTTP 状态码
 */
int httpStatusFor(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

}} // namespace excelpager::core
