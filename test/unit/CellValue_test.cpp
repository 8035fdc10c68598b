#include "excelpager/core/CellValue.hpp"

#include <gtest/gtest.h>

namespace excelpager {
namespace core {

TEST(CellValueTest, Blankness) {
    EXPECT_TRUE(isBlank(CellValue{}));
    EXPECT_TRUE(isBlank(CellValue(std::string())));
    EXPECT_FALSE(isBlank(CellValue(std::string(" "))));
    EXPECT_FALSE(isBlank(CellValue(int64_t(0))));
    EXPECT_FALSE(isBlank(CellValue(false)));

    EXPECT_TRUE(isBlankRow(Row{}));
    EXPECT_TRUE(isBlankRow(Row{CellValue{}, CellValue(std::string())}));
    EXPECT_FALSE(isBlankRow(Row{CellValue{}, CellValue(0.0)}));
}

TEST(CellValueTest, ToText) {
    EXPECT_EQ(toText(CellValue{}), "");
    EXPECT_EQ(toText(CellValue(std::string("Name"))), "Name");
    EXPECT_EQ(toText(CellValue(int64_t(2024))), "2024");
    EXPECT_EQ(toText(CellValue(2.5)), "2.5");
    EXPECT_EQ(toText(CellValue(true)), "true");

    DateTime dt;
    dt.year = 2024;
    dt.month = 3;
    dt.day = 9;
    EXPECT_EQ(toText(CellValue(dt)), "2024-03-09T00:00:00");
}

TEST(CellValueTest, DateTimeIsoString) {
    DateTime dt;
    dt.year = 1999;
    dt.month = 12;
    dt.day = 31;
    dt.hour = 23;
    dt.minute = 59;
    dt.second = 58;
    EXPECT_EQ(dt.toIsoString(), "1999-12-31T23:59:58");

    dt.millisecond = 7;
    EXPECT_EQ(dt.toIsoString(), "1999-12-31T23:59:58.007");

    // 纯日期同样带时间部分
    DateTime midnight;
    midnight.year = 2024;
    midnight.month = 1;
    midnight.day = 15;
    EXPECT_EQ(midnight.toIsoString(), "2024-01-15T00:00:00");

    DateTime other = dt;
    EXPECT_EQ(dt, other);
    other.millisecond = 8;
    EXPECT_NE(dt, other);
}

TEST(CellValueTest, MakeHeader) {
    Row header_row{CellValue(std::string("id")), CellValue{}, CellValue(int64_t(2023)),
                   CellValue(std::string("name"))};
    Header header = makeHeader(header_row);
    ASSERT_EQ(header.size(), 4u);
    EXPECT_EQ(header[0], "id");
    EXPECT_EQ(header[1], "");
    EXPECT_EQ(header[2], "2023");
    EXPECT_EQ(header[3], "name");
}

TEST(CellValueTest, PairRecordPadsShortRows) {
    Header header{"Name", "Age", "City"};
    Record record = pairRecord(header, Row{CellValue(std::string("Alice")), CellValue(int64_t(30))});

    ASSERT_EQ(record.size(), 3u);
    EXPECT_EQ(record[0].name, "Name");
    EXPECT_EQ(std::get<std::string>(record[0].value), "Alice");
    EXPECT_EQ(std::get<int64_t>(record[1].value), 30);
    EXPECT_EQ(record[2].name, "City");
    EXPECT_TRUE(isAbsent(record[2].value));
}

TEST(CellValueTest, PairRecordDropsExtraCells) {
    Header header{"A"};
    Record record = pairRecord(header, Row{CellValue(int64_t(1)), CellValue(int64_t(2))});
    ASSERT_EQ(record.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(record[0].value), 1);

    EXPECT_TRUE(pairRecord(Header{}, Row{CellValue(int64_t(1))}).empty());
}

TEST(CellValueTest, PairRecordKeepsDuplicateNames) {
    Header header{"x", "x"};
    Record record = pairRecord(header, Row{CellValue(int64_t(1)), CellValue(int64_t(2))});
    ASSERT_EQ(record.size(), 2u);
    EXPECT_EQ(record[0].name, "x");
    EXPECT_EQ(record[1].name, "x");
}

}} // namespace excelpager::core
