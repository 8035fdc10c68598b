#pragma once

namespace excelpager {
namespace archive {

// 错误码枚举
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // ZIP 文件未打开
    IoFail,               // I/O 操作失败
    BadFormat,            // ZIP 格式错误
    FileNotFound,         // 条目未找到
    InvalidParameter,     // 无效参数
    EntryBusy,            // 已有条目处于打开状态
    InternalError         // 内部错误
};

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

inline const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok: return "Ok";
        case ZipError::NotOpen: return "NotOpen";
        case ZipError::IoFail: return "IoFail";
        case ZipError::BadFormat: return "BadFormat";
        case ZipError::FileNotFound: return "FileNotFound";
        case ZipError::InvalidParameter: return "InvalidParameter";
        case ZipError::EntryBusy: return "EntryBusy";
        case ZipError::InternalError: return "InternalError";
        default: return "Unknown";
    }
}

}} // namespace excelpager::archive
