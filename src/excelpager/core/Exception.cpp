/**
 * @file Exception.cpp
 * @brief ExcelPager异常类实现
 */

#include "excelpager/core/Exception.hpp"
#include "excelpager/core/Expected.hpp"
#include <sstream>
#include <fmt/format.h>

namespace excelpager {
namespace core {

// ExcelPagerException 实现
ExcelPagerException::ExcelPagerException(const std::string& message,
                                         ErrorCode code,
                                         const char* file,
                                         int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string ExcelPagerException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << toString(error_code_) << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void ExcelPagerException::addContext(const std::string& context) {
    context_.push_back(context);
}

// FileException 实现
FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : ExcelPagerException(fmt::format("{} (file: {})", message, filename), code, file, line)
    , filename_(filename) {
}

// ParameterException 实现
ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : ExcelPagerException(parameter_name.empty() ? message :
                          fmt::format("{} (parameter: {})", message, parameter_name),
                          ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

// ConfigException 实现
ConfigException::ConfigException(const std::string& message,
                                 const std::string& key,
                                 const char* file, int line)
    : ExcelPagerException(key.empty() ? message : fmt::format("{} (key: {})", message, key),
                          ErrorCode::InvalidConfig, file, line)
    , key_(key) {
}

// ReadException 实现
ReadException::ReadException(const std::string& message, ErrorCode code,
                             const char* file, int line)
    : ExcelPagerException(message, code, file, line) {
}

void throwError(const Error& error) {
    switch (kindOf(error.code)) {
        case ErrorKind::NotFound:
        case ErrorKind::Unreadable:
            throw FileException(error.message, error.context, error.code);
        case ErrorKind::InvalidParameter:
            throw ParameterException(error.fullMessage());
        case ErrorKind::ReadFailure:
            throw ReadException(error.fullMessage(), error.code);
        default:
            if (error.code == ErrorCode::InvalidConfig) {
                throw ConfigException(error.message, error.context);
            }
            throw ExcelPagerException(error.fullMessage(), error.code);
    }
}

} // namespace core
} // namespace excelpager
