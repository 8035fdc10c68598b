#include "excelpager/utils/UrlCodec.hpp"

#include <gtest/gtest.h>

namespace excelpager {
namespace utils {

TEST(UrlCodecTest, EncodePathSegment) {
    EXPECT_EQ(UrlCodec::encodePathSegment("report.xlsx"), "report.xlsx");
    EXPECT_EQ(UrlCodec::encodePathSegment("Q1 Sales.xlsx"), "Q1%20Sales.xlsx");
    EXPECT_EQ(UrlCodec::encodePathSegment("a/b?c&d"), "a%2Fb%3Fc%26d");
    EXPECT_EQ(UrlCodec::encodePathSegment("数据"), "%E6%95%B0%E6%8D%AE");
    EXPECT_EQ(UrlCodec::encodePathSegment("~_-."), "~_-.");
    EXPECT_EQ(UrlCodec::encodePathSegment(""), "");
}

TEST(UrlCodecTest, Decode) {
    EXPECT_EQ(UrlCodec::decode("Q1%20Sales.xlsx").value(), "Q1 Sales.xlsx");
    EXPECT_EQ(UrlCodec::decode("%e6%95%b0%E6%8D%AE").value(), "数据");
    EXPECT_EQ(UrlCodec::decode("a+b").value(), "a+b");
    EXPECT_EQ(UrlCodec::decode("a+b", true).value(), "a b");

    EXPECT_FALSE(UrlCodec::decode("%").has_value());
    EXPECT_FALSE(UrlCodec::decode("abc%4").has_value());
    EXPECT_FALSE(UrlCodec::decode("%G1").has_value());
}

TEST(UrlCodecTest, EncodeThenDecode) {
    const std::string name = "Sheet #1 / 100% (draft)";
    EXPECT_EQ(UrlCodec::decode(UrlCodec::encodePathSegment(name)).value(), name);
}

TEST(UrlCodecTest, ParseQuery) {
    auto params = UrlCodec::parseQuery("page=2&sort=name+asc&flag&empty=");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("page"), "2");
    EXPECT_EQ(params->at("sort"), "name asc");
    EXPECT_EQ(params->at("flag"), "");
    EXPECT_EQ(params->at("empty"), "");
}

TEST(UrlCodecTest, ParseQueryFirstOccurrenceWins) {
    auto params = UrlCodec::parseQuery("page=1&page=5");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->at("page"), "1");
}

TEST(UrlCodecTest, ParseQueryEdgeCases) {
    auto empty = UrlCodec::parseQuery("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());

    auto separators = UrlCodec::parseQuery("&&page=3&");
    ASSERT_TRUE(separators.has_value());
    EXPECT_EQ(separators->at("page"), "3");

    EXPECT_FALSE(UrlCodec::parseQuery("page=%zz").has_value());
}

}} // namespace excelpager::utils
