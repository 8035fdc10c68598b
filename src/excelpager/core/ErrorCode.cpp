#include "excelpager/core/ErrorCode.hpp"

namespace excelpager {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::OutOfMemory: return "OutOfMemory";
        case ErrorCode::InternalError: return "InternalError";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileAccessDenied: return "FileAccessDenied";
        case ErrorCode::FileCorrupted: return "FileCorrupted";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::SheetNotFound: return "SheetNotFound";
        case ErrorCode::SheetNameRequired: return "SheetNameRequired";
        case ErrorCode::InvalidWorkbook: return "InvalidWorkbook";
        case ErrorCode::InvalidWorksheet: return "InvalidWorksheet";
        case ErrorCode::InvalidCellReference: return "InvalidCellReference";
        case ErrorCode::InvalidCellValue: return "InvalidCellValue";
        case ErrorCode::ZipError: return "ZipError";
        case ErrorCode::XmlParseError: return "XmlParseError";
        case ErrorCode::XmlMissingElement: return "XmlMissingElement";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::RouteNotFound: return "RouteNotFound";
        case ErrorCode::MethodNotAllowed: return "MethodNotAllowed";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        default: return "Unknown";
    }
}

ErrorKind kindOf(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return ErrorKind::None;
        case ErrorCode::FileNotFound:
        case ErrorCode::SheetNotFound:
        case ErrorCode::RouteNotFound:
            return ErrorKind::NotFound;
        case ErrorCode::InvalidArgument:
        case ErrorCode::SheetNameRequired:
            return ErrorKind::InvalidParameter;
        case ErrorCode::FileCorrupted:
        case ErrorCode::FileAccessDenied:
        case ErrorCode::InvalidWorkbook:
            return ErrorKind::Unreadable;
        case ErrorCode::FileReadError:
        case ErrorCode::InvalidWorksheet:
        case ErrorCode::InvalidCellReference:
        case ErrorCode::InvalidCellValue:
        case ErrorCode::ZipError:
        case ErrorCode::XmlParseError:
        case ErrorCode::XmlMissingElement:
            return ErrorKind::ReadFailure;
        case ErrorCode::Cancelled:
            return ErrorKind::Cancelled;
        case ErrorCode::Unauthorized:
            return ErrorKind::Unauthorized;
        case ErrorCode::RateLimited:
            return ErrorKind::RateLimited;
        case ErrorCode::MethodNotAllowed:
            return ErrorKind::MethodNotAllowed;
        default:
            return ErrorKind::Internal;
    }
}

int httpStatusFor(ErrorCode code) noexcept {
    switch (kindOf(code)) {
        case ErrorKind::None: return 200;
        case ErrorKind::NotFound: return 404;
        case ErrorKind::InvalidParameter: return 400;
        case ErrorKind::Unauthorized: return 401;
        case ErrorKind::MethodNotAllowed: return 405;
        case ErrorKind::RateLimited: return 429;
        case ErrorKind::Cancelled: return 503;
        case ErrorKind::Unreadable:
        case ErrorKind::ReadFailure:
        case ErrorKind::Internal:
        default:
            return 500;
    }
}

}} // namespace excelpager::core
