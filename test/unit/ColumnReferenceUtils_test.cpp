#include "excelpager/utils/ColumnReferenceUtils.hpp"

#include <gtest/gtest.h>

namespace excelpager {
namespace utils {

TEST(ColumnReferenceUtilsTest, ParseColumn) {
    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast("A1"), 1u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast("C23"), 3u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast("Z9"), 26u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast("AA1"), 27u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast("$B$2"), 2u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast("xfd1048576"), 16384u);

    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast(""), 0u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast("1A"), 0u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast("XFE1"), 0u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnFast("ABCD1"), 0u);
}

TEST(ColumnReferenceUtilsTest, ParseColumnOnly) {
    EXPECT_EQ(ColumnReferenceUtils::parseColumnOnly("B"), 2u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnOnly("$AZ"), 52u);
    EXPECT_EQ(ColumnReferenceUtils::parseColumnOnly("A1"), 0u);
}

TEST(ColumnReferenceUtilsTest, ParseRow) {
    EXPECT_EQ(ColumnReferenceUtils::parseRowFast("A1"), 1u);
    EXPECT_EQ(ColumnReferenceUtils::parseRowFast("$C$100"), 100u);
    EXPECT_EQ(ColumnReferenceUtils::parseRowFast("XFD1048576"), 1048576u);
    EXPECT_EQ(ColumnReferenceUtils::parseRowFast("A1048577"), 0u);
    EXPECT_EQ(ColumnReferenceUtils::parseRowFast("A"), 0u);
    EXPECT_EQ(ColumnReferenceUtils::parseRowFast("A1B"), 0u);
}

TEST(ColumnReferenceUtilsTest, ParseCellReference) {
    uint32_t row = 0;
    uint32_t col = 0;
    ASSERT_TRUE(ColumnReferenceUtils::parseCellReference("AB12", row, col));
    EXPECT_EQ(row, 12u);
    EXPECT_EQ(col, 28u);

    EXPECT_FALSE(ColumnReferenceUtils::parseCellReference("A0", row, col));
    EXPECT_FALSE(ColumnReferenceUtils::parseCellReference("A1:B2", row, col));
}

TEST(ColumnReferenceUtilsTest, ParseRangeLastRow) {
    uint32_t last_row = 0;
    ASSERT_TRUE(ColumnReferenceUtils::parseRangeLastRow("A1:C100", last_row));
    EXPECT_EQ(last_row, 100u);
    ASSERT_TRUE(ColumnReferenceUtils::parseRangeLastRow("B7", last_row));
    EXPECT_EQ(last_row, 7u);
    ASSERT_TRUE(ColumnReferenceUtils::parseRangeLastRow("$A$1:$D$20", last_row));
    EXPECT_EQ(last_row, 20u);

    last_row = 42;
    EXPECT_FALSE(ColumnReferenceUtils::parseRangeLastRow("A1:", last_row));
    EXPECT_FALSE(ColumnReferenceUtils::parseRangeLastRow("", last_row));
    EXPECT_EQ(last_row, 42u);
}

}} // namespace excelpager::utils
