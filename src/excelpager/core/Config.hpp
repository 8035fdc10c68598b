#pragma once

#include "excelpager/core/Path.hpp"
#include "excelpager/utils/Logger.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace excelpager {
namespace core {

/**
 * @brief 未指定工作表名时的选择方式
 */
enum class SheetSelectionMode {
    RequireName,   // 多工作表文件必须显式指定工作表（默认）
    FirstSheet     // 单工作表接口形式：取工作簿顺序中的第一个工作表
};

/**
 * @brief total_rows 的计算方式
 */
enum class RowCountMode {
    Scan,        // 完整扫描 sheetData（默认）
    Dimension    // 优先使用 <dimension ref="A1:C100">，缺失或无效时回退到扫描
};

const char* toString(SheetSelectionMode mode);
const char* toString(RowCountMode mode);

/**
 * @brief 固定窗口限流规则，如 "100 per hour"
 */
struct RateLimitSpec {
    uint32_t requests = 100;
    std::chrono::seconds window{3600};

    /**
     * @brief 解析 "<n> per <second|minute|hour|day>"（单位可带复数s，大小写不敏感）
     * @throws ConfigException 格式无效或 n 为0
     */
    static RateLimitSpec parse(const std::string& text);

    std::string toString() const;
};

/**
 * @brief 服务配置（不可变值）
 *
 * 进程启动时构造一次，之后按值或常量引用传给定位器与边界层。
 */
class ServiceConfig {
public:
    using Values = std::map<std::string, std::string>;

    /**
     * @brief 从环境变量构造
     *
     * 先读取 env_file（KEY=VALUE 行，# 注释，可带引号），
     * 已存在的真实环境变量优先于文件中的值。
     * @throws ConfigException 缺少 API_KEY 或任意取值无效
     */
    static ServiceConfig fromEnvironment(const std::string& env_file = ".env");

    /**
     * @brief 从键值表构造（未出现的键取默认值）
     * @throws ConfigException
     */
    static ServiceConfig fromValues(const Values& values);

    /**
     * @brief 解析 .env 文件内容
     */
    static Values parseEnvFile(const std::string& content);

    /**
     * @brief 检查数据目录存在且是目录
     * @throws ConfigException
     */
    void validate() const;

    const std::string& apiKey() const { return api_key_; }
    const Path& dataDir() const { return data_dir_; }
    int64_t perPage() const { return per_page_; }
    const RateLimitSpec& rateLimit() const { return rate_limit_; }
    const std::string& bindAddress() const { return bind_address_; }
    uint16_t port() const { return port_; }
    SheetSelectionMode sheetSelection() const { return sheet_selection_; }
    RowCountMode rowCountMode() const { return row_count_mode_; }
    std::chrono::milliseconds requestTimeout() const { return request_timeout_; }
    // 连接上单次读或写的最长等待时间
    std::chrono::milliseconds connectionTimeout() const { return connection_timeout_; }
    const std::string& logFile() const { return log_file_; }
    Logger::Level logLevel() const { return log_level_; }
    bool logConsole() const { return log_console_; }

private:
    ServiceConfig() = default;

    std::string api_key_;
    Path data_dir_{"./data"};
    int64_t per_page_ = 1000;
    RateLimitSpec rate_limit_;
    std::string bind_address_ = "127.0.0.1";
    uint16_t port_ = 5000;
    SheetSelectionMode sheet_selection_ = SheetSelectionMode::RequireName;
    RowCountMode row_count_mode_ = RowCountMode::Scan;
    std::chrono::milliseconds request_timeout_{0};
    std::chrono::milliseconds connection_timeout_{30000};
    std::string log_file_ = "logs/excelpager.log";
    Logger::Level log_level_ = Logger::Level::INFO;
    bool log_console_ = true;
};

}} // namespace excelpager::core
