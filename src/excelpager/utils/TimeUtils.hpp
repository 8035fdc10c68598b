#pragma once

#include "excelpager/core/CellValue.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace excelpager {
namespace utils {

/**
 * @brief 时间工具类 - Excel日期序列号与ISO-8601之间的转换
 */
class TimeUtils {
public:
    /**
     * @brief Excel日期序列号转为日期时间
     *
     * 1900日期系统：序列号1为1900-01-01，保留Excel把1900年当作闰年的错误
     * （序列号60没有对应的真实日期，按1900-02-28处理，61起为1900-03-01）。
     * 1904日期系统：序列号0为1904-01-01。
     * 小数部分为一天中的时间，四舍五入到毫秒。
     * @return 负数、非有限值或超出9999年时返回 std::nullopt
     */
    static std::optional<core::DateTime> fromExcelSerial(double serial, bool date1904);

    /**
     * @brief 解析 t="d" 单元格中的ISO-8601文本
     *
     * 接受 "YYYY-MM-DD"、"YYYY-MM-DDTHH:MM[:SS[.fff]]"、结尾可带 "Z"，
     * 也接受只有时间的 "HH:MM[:SS]"（日期取1899-12-30）。
     */
    static std::optional<core::DateTime> parseIsoDateTime(std::string_view text);

    /**
     * @brief 公历日期到1970-01-01的天数
     */
    static int64_t daysFromCivil(int year, int month, int day);

    /**
     * @brief 1970-01-01起的天数转公历日期
     */
    static void civilFromDays(int64_t days, int& year, int& month, int& day);

    /**
     * @brief 耗时计时器
     */
    class PerformanceTimer {
    private:
        std::chrono::steady_clock::time_point start_;

    public:
        PerformanceTimer() : start_(std::chrono::steady_clock::now()) {}

        int64_t elapsedMs() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_).count();
        }
    };
};

}} // namespace excelpager::utils
