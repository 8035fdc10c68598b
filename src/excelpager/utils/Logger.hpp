#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <atomic>
#include <cstring>
#include <algorithm>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace excelpager {

class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖模式（默认）
        APPEND = 1     // 追加模式
    };

    static Logger& getInstance();

    void initialize(const std::string& log_file_path = "logs/excelpager.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::APPEND);

    void setLevel(Level level);
    Level getLevel() const;
    bool isInitialized() const { return initialized_.load(); }

    /**
     * @brief 解析日志级别字符串（trace/debug/info/warn/error/critical/off）
     * @return 未识别时返回 false，level 保持不变
     */
    static bool parseLevel(const std::string& text, Level& level);

    void log(Level level, const std::string& message);

    // 带源码位置信息的格式化接口（在宏中使用）
    template<typename... Args>
    inline void logCtx(Level level, const char* file, int line, const char* func,
                       const std::string& fmt_str, Args&&... args) {
        if (!should_log(level)) return;
        std::string body;
        try {
            body = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            body = fmt_str;
        }
        log(level, fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", body));
    }

    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    bool should_log(Level level) const;
    void log_to_console(Level level, const std::string& message);
    void log_to_file(const std::string& message);
    std::string format_message(Level level, const std::string& message) const;
    static const char* level_to_string(Level level);
    std::string get_timestamp() const;
    void rotate_file_if_needed();
    std::string get_rotated_filename(size_t index) const;

    // 提取文件名（去除路径）
    static inline const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (std::max(slash1, slash2)) : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
    WriteMode write_mode_ = WriteMode::APPEND;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define EXCELPAGER_FUNC __FUNCTION__
#else
#  define EXCELPAGER_FUNC __func__
#endif

// 统一日志宏（带源码位置信息）
#define EXCELPAGER_LOG_TRACE(fmt, ...)    excelpager::Logger::getInstance().logCtx(excelpager::Logger::Level::TRACE,    __FILE__, __LINE__, EXCELPAGER_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPAGER_LOG_DEBUG(fmt, ...)    excelpager::Logger::getInstance().logCtx(excelpager::Logger::Level::DEBUG,    __FILE__, __LINE__, EXCELPAGER_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPAGER_LOG_INFO(fmt, ...)     excelpager::Logger::getInstance().logCtx(excelpager::Logger::Level::INFO,     __FILE__, __LINE__, EXCELPAGER_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPAGER_LOG_WARN(fmt, ...)     excelpager::Logger::getInstance().logCtx(excelpager::Logger::Level::WARN,     __FILE__, __LINE__, EXCELPAGER_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPAGER_LOG_ERROR(fmt, ...)    excelpager::Logger::getInstance().logCtx(excelpager::Logger::Level::ERROR,    __FILE__, __LINE__, EXCELPAGER_FUNC, fmt, ##__VA_ARGS__)
#define EXCELPAGER_LOG_CRITICAL(fmt, ...) excelpager::Logger::getInstance().logCtx(excelpager::Logger::Level::CRITICAL, __FILE__, __LINE__, EXCELPAGER_FUNC, fmt, ##__VA_ARGS__)

} // namespace excelpager
