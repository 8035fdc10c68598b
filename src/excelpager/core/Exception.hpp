/**
 * @file Exception.hpp
 * @brief ExcelPager异常类定义
 */

#ifndef EXCELPAGER_EXCEPTION_HPP
#define EXCELPAGER_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace excelpager {
namespace core {

/**
 * @brief ExcelPager基础异常类
 */
class ExcelPagerException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    ExcelPagerException(const std::string& message,
                        ErrorCode code = ErrorCode::InternalError,
                        const char* file = nullptr,
                        int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取详细错误信息（错误码、位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public ExcelPagerException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public ExcelPagerException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 配置相关异常（仅在进程启动时抛出）
 */
class ConfigException : public ExcelPagerException {
public:
    ConfigException(const std::string& message,
                    const std::string& key = "",
                    const char* file = nullptr, int line = 0);

    const std::string& getKey() const { return key_; }

private:
    std::string key_;
};

/**
 * @brief 读取相关异常（ZIP/XML/单元格解码）
 */
class ReadException : public ExcelPagerException {
public:
    ReadException(const std::string& message,
                  ErrorCode code = ErrorCode::FileReadError,
                  const char* file = nullptr, int line = 0);
};

} // namespace core
} // namespace excelpager

#endif // EXCELPAGER_EXCEPTION_HPP
