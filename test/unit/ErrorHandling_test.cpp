#include "excelpager/core/ErrorCode.hpp"
#include "excelpager/core/Exception.hpp"
#include "excelpager/core/Expected.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace excelpager {
namespace core {

TEST(ErrorCodeTest, KindsMapToHttpStatus) {
    EXPECT_EQ(kindOf(ErrorCode::Ok), ErrorKind::None);
    EXPECT_EQ(httpStatusFor(ErrorCode::FileNotFound), 404);
    EXPECT_EQ(httpStatusFor(ErrorCode::SheetNotFound), 404);
    EXPECT_EQ(httpStatusFor(ErrorCode::InvalidArgument), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::SheetNameRequired), 400);
    EXPECT_EQ(httpStatusFor(ErrorCode::FileCorrupted), 500);
    EXPECT_EQ(httpStatusFor(ErrorCode::XmlParseError), 500);
    EXPECT_EQ(httpStatusFor(ErrorCode::Cancelled), 503);
    EXPECT_EQ(httpStatusFor(ErrorCode::Unauthorized), 401);
    EXPECT_EQ(httpStatusFor(ErrorCode::RateLimited), 429);
    EXPECT_EQ(httpStatusFor(ErrorCode::MethodNotAllowed), 405);

    EXPECT_EQ(kindOf(ErrorCode::InvalidWorkbook), ErrorKind::Unreadable);
    EXPECT_EQ(kindOf(ErrorCode::InvalidCellValue), ErrorKind::ReadFailure);
}

TEST(ErrorCodeTest, FullMessageIncludesContext) {
    Error plain(ErrorCode::SheetNotFound, "Sheet not found");
    EXPECT_EQ(plain.fullMessage(), "Sheet not found");

    Error with_context(ErrorCode::FileCorrupted, "Bad zip", "data/a.xlsx");
    EXPECT_EQ(with_context.fullMessage(), "Bad zip (Context: data/a.xlsx)");
    EXPECT_TRUE(with_context.isError());
    EXPECT_TRUE(success().isOk());
}

TEST(ExpectedTest, HoldsValueOrError) {
    Result<std::string> ok(std::string("value"));
    ASSERT_TRUE(ok);
    EXPECT_EQ(*ok, "value");
    EXPECT_EQ(ok->size(), 5u);

    Result<std::string> failed(Error(ErrorCode::InvalidArgument, "bad"));
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::InvalidArgument);

    failed = ok;
    ASSERT_TRUE(failed);
    EXPECT_EQ(failed.value(), "value");

    Result<std::unique_ptr<int>> owned(std::make_unique<int>(7));
    std::unique_ptr<int> taken = std::move(owned).valueOrThrow();
    ASSERT_TRUE(taken);
    EXPECT_EQ(*taken, 7);
}

TEST(ExpectedTest, ValueOrThrowRaisesMatchingException) {
    Result<int> missing(Error(ErrorCode::FileNotFound, "File not found", "report.xlsx"));
    try {
        missing.valueOrThrow();
        FAIL() << "expected FileException";
    } catch (const FileException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::FileNotFound);
        EXPECT_EQ(e.getFilename(), "report.xlsx");
    }

    VoidResult bad_page(Error(ErrorCode::InvalidArgument, "Invalid page value"));
    EXPECT_THROW(bad_page.valueOrThrow(), ParameterException);

    VoidResult read_failed(Error(ErrorCode::XmlParseError, "mismatched tag"));
    EXPECT_THROW(read_failed.valueOrThrow(), ReadException);

    VoidResult config(Error(ErrorCode::InvalidConfig, "PORT out of range", "PORT"));
    try {
        config.valueOrThrow();
        FAIL() << "expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.getKey(), "PORT");
    }

    VoidResult cancelled(Error(ErrorCode::Cancelled, "deadline"));
    EXPECT_THROW(cancelled.valueOrThrow(), ExcelPagerException);

    VoidResult fine;
    EXPECT_NO_THROW(fine.valueOrThrow());
}

TEST(ExceptionTest, DetailedMessage) {
    ExcelPagerException e("boom", ErrorCode::InternalError, "Foo.cpp", 12);
    e.addContext("while paging");
    std::string detail = e.getDetailedMessage();
    EXPECT_NE(detail.find("boom"), std::string::npos);
    EXPECT_NE(detail.find("Foo.cpp:12"), std::string::npos);
    EXPECT_NE(detail.find("while paging"), std::string::npos);
    ASSERT_EQ(e.getContext().size(), 1u);
}

}} // namespace excelpager::core
