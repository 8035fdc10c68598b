#include "excelpager/utils/TimeUtils.hpp"

#include <cmath>
#include <gtest/gtest.h>

namespace excelpager {
namespace utils {

namespace {

std::string serialToIso(double serial, bool date1904 = false) {
    auto dt = TimeUtils::fromExcelSerial(serial, date1904);
    return dt ? dt->toIsoString() : std::string("<none>");
}

std::string isoRoundTrip(std::string_view text) {
    auto dt = TimeUtils::parseIsoDateTime(text);
    return dt ? dt->toIsoString() : std::string("<none>");
}

} // namespace

TEST(TimeUtilsTest, Serial1900System) {
    EXPECT_EQ(serialToIso(1), "1900-01-01T00:00:00");
    EXPECT_EQ(serialToIso(59), "1900-02-28T00:00:00");
    // Excel 把1900年当作闰年，序列号60不是真实日期
    EXPECT_EQ(serialToIso(60), "1900-02-28T00:00:00");
    EXPECT_EQ(serialToIso(61), "1900-03-01T00:00:00");
    EXPECT_EQ(serialToIso(45292), "2024-01-01T00:00:00");
    EXPECT_EQ(serialToIso(2958465), "9999-12-31T00:00:00");
}

TEST(TimeUtilsTest, Serial1904System) {
    EXPECT_EQ(serialToIso(0, true), "1904-01-01T00:00:00");
    EXPECT_EQ(serialToIso(1, true), "1904-01-02T00:00:00");
    EXPECT_EQ(serialToIso(43830, true), "2024-01-01T00:00:00");
}

TEST(TimeUtilsTest, TimeOfDay) {
    EXPECT_EQ(serialToIso(45292.5), "2024-01-01T12:00:00");
    EXPECT_EQ(serialToIso(45292.75), "2024-01-01T18:00:00");
    EXPECT_EQ(serialToIso(0.25), "1899-12-30T06:00:00");
    // 四舍五入到毫秒
    EXPECT_EQ(serialToIso(45292 + 1.5 / 86400.0), "2024-01-01T00:00:01.500");
}

TEST(TimeUtilsTest, OutOfRangeSerial) {
    EXPECT_FALSE(TimeUtils::fromExcelSerial(-1, false).has_value());
    EXPECT_FALSE(TimeUtils::fromExcelSerial(3000000, false).has_value());
    EXPECT_FALSE(TimeUtils::fromExcelSerial(std::nan(""), false).has_value());
    EXPECT_FALSE(TimeUtils::fromExcelSerial(INFINITY, false).has_value());
}

TEST(TimeUtilsTest, ParseIsoDateTime) {
    EXPECT_EQ(isoRoundTrip("2024-02-29"), "2024-02-29T00:00:00");
    EXPECT_EQ(isoRoundTrip("2024-02-29T13:45"), "2024-02-29T13:45:00");
    EXPECT_EQ(isoRoundTrip("2024-02-29T13:45:10Z"), "2024-02-29T13:45:10");
    EXPECT_EQ(isoRoundTrip("2024-02-29 13:45:10.25"), "2024-02-29T13:45:10.250");
    EXPECT_EQ(isoRoundTrip("08:30:00"), "1899-12-30T08:30:00");
}

TEST(TimeUtilsTest, ParseIsoDateTimeRejectsInvalid) {
    EXPECT_EQ(isoRoundTrip("2023-02-29"), "<none>");
    EXPECT_EQ(isoRoundTrip("2024-13-01"), "<none>");
    EXPECT_EQ(isoRoundTrip("2024-01-01X"), "<none>");
    EXPECT_EQ(isoRoundTrip("2024-01-01T25:00"), "<none>");
    EXPECT_EQ(isoRoundTrip("not a date"), "<none>");
    EXPECT_EQ(isoRoundTrip(""), "<none>");
}

TEST(TimeUtilsTest, CivilDayConversion) {
    EXPECT_EQ(TimeUtils::daysFromCivil(1970, 1, 1), 0);
    EXPECT_EQ(TimeUtils::daysFromCivil(2000, 3, 1), 11017);

    int year = 0;
    int month = 0;
    int day = 0;
    TimeUtils::civilFromDays(11017, year, month, day);
    EXPECT_EQ(year, 2000);
    EXPECT_EQ(month, 3);
    EXPECT_EQ(day, 1);

    TimeUtils::civilFromDays(-1, year, month, day);
    EXPECT_EQ(year, 1969);
    EXPECT_EQ(month, 12);
    EXPECT_EQ(day, 31);
}

}} // namespace excelpager::utils
