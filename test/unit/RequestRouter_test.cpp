#include "excelpager/server/PageSerializer.hpp"
#include "excelpager/server/RequestRouter.hpp"
#include "XlsxFixture.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace excelpager {
namespace server {

using test::inlineStr;
using test::number;
using test::row;
using test::worksheetXml;

class RequestRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::string people = worksheetXml(
            row(1, {inlineStr("A1", "Name"), inlineStr("B1", "Age")}) +
            row(2, {inlineStr("A2", "Alice"), number("B2", "30")}) +
            row(4, {inlineStr("A4", "Bob"), number("B4", "25")}));

        ASSERT_TRUE(test::XlsxBuilder()
                        .addSheet("Data Sheet", people)
                        .addSheet("Notes", worksheetXml(row(1, {inlineStr("A1", "Note")})))
                        .write(temp_.file("sales.xlsx")));
        ASSERT_TRUE(test::XlsxBuilder().addSheet("Only", people).write(temp_.file("single.xlsx")));
        temp_.writeText("broken.xlsx", "this is not a zip archive");
        temp_.writeText("readme.txt", "ignored");
    }

    RequestRouter makeRouter(const std::string& rate_limit = "1000 per minute",
                             const std::string& selection = "require-name") {
        return RequestRouter(core::ServiceConfig::fromValues({
            {"API_KEY", "test-key"},
            {"DATA_DIR", temp_.path().string()},
            {"PER_PAGE", "2"},
            {"RATE_LIMIT", rate_limit},
            {"SHEET_SELECTION", selection},
        }));
    }

    static HttpRequest get(const std::string& target) {
        HttpRequest request;
        request.target = target;
        request.authorization = "Bearer test-key";
        request.client = "127.0.0.1";
        return request;
    }

    static nlohmann::json body(const HttpResponse& response) {
        return nlohmann::json::parse(response.body);
    }

    test::TempDir temp_;
};

TEST_F(RequestRouterTest, RejectsMissingOrWrongToken) {
    RequestRouter router = makeRouter();

    HttpRequest request = get("/files");
    request.authorization.clear();
    HttpResponse response = router.handle(request);
    EXPECT_EQ(response.status, 401);
    EXPECT_EQ(body(response)["error"], "Unauthorized");

    request.authorization = "Bearer wrong";
    EXPECT_EQ(router.handle(request).status, 401);
}

TEST_F(RequestRouterTest, RateLimitAppliesBeforeAuth) {
    RequestRouter router = makeRouter("2 per hour");

    HttpRequest anonymous = get("/files");
    anonymous.authorization.clear();
    EXPECT_EQ(router.handle(anonymous).status, 401);
    EXPECT_EQ(router.handle(get("/files")).status, 200);

    HttpResponse limited = router.handle(get("/files"));
    EXPECT_EQ(limited.status, 429);
    ASSERT_TRUE(limited.retry_after.has_value());
    EXPECT_GT(*limited.retry_after, 0);
    EXPECT_EQ(body(limited)["error"], "Rate limit exceeded");

    HttpRequest other = get("/files");
    other.client = "10.1.1.1";
    EXPECT_EQ(router.handle(other).status, 200);
}

TEST_F(RequestRouterTest, ListFiles) {
    RequestRouter router = makeRouter();
    HttpResponse response = router.handle(get("/files"));
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(body(response)["files"], nlohmann::json::array({"broken.xlsx", "sales.xlsx", "single.xlsx"}));
}

TEST_F(RequestRouterTest, ListSheets) {
    RequestRouter router = makeRouter();
    HttpResponse response = router.handle(get("/file/sales.xlsx/sheets"));
    ASSERT_EQ(response.status, 200);
    auto json = body(response);
    EXPECT_EQ(json["file"], "sales.xlsx");
    EXPECT_EQ(json["sheets"], nlohmann::json::array({"Data Sheet", "Notes"}));

    EXPECT_EQ(router.handle(get("/file/nothing.xlsx/sheets")).status, 404);
}

TEST_F(RequestRouterTest, PageOfNamedSheet) {
    RequestRouter router = makeRouter();

    HttpResponse first = router.handle(get("/file/sales.xlsx/sheet/Data%20Sheet?page=1"));
    ASSERT_EQ(first.status, 200) << first.body;
    EXPECT_EQ(first.body.rfind("{\"file\":\"sales.xlsx\",\"sheet\":\"Data Sheet\",\"page\":1,\"per_page\":2,", 0), 0u);

    auto json = body(first);
    EXPECT_EQ(json["total_rows"], 3);
    EXPECT_EQ(json["total_pages"], 2);
    EXPECT_EQ(json["has_more"], true);
    EXPECT_EQ(json["next_page"], 2);
    EXPECT_EQ(json["next_page_url"], "/file/sales.xlsx/sheet/Data%20Sheet?page=2");
    ASSERT_EQ(json["data"].size(), 1u);
    EXPECT_EQ(json["data"][0]["Name"], "Alice");
    EXPECT_EQ(json["data"][0]["Age"], 30);

    auto second = body(router.handle(get("/file/sales.xlsx/sheet/Data%20Sheet?page=2")));
    ASSERT_EQ(second["data"].size(), 1u);
    EXPECT_EQ(second["data"][0]["Name"], "Bob");
    EXPECT_EQ(second["has_more"], false);
    EXPECT_TRUE(second["next_page"].is_null());
    EXPECT_TRUE(second["next_page_url"].is_null());

    auto beyond = body(router.handle(get("/file/sales.xlsx/sheet/Data%20Sheet?page=9")));
    EXPECT_TRUE(beyond["data"].empty());
    EXPECT_EQ(beyond["total_rows"], 3);
}

TEST_F(RequestRouterTest, SingleSheetRouteOmitsSheetField) {
    RequestRouter router = makeRouter();
    HttpResponse response = router.handle(get("/file/single.xlsx"));
    ASSERT_EQ(response.status, 200) << response.body;
    auto json = body(response);
    EXPECT_FALSE(json.contains("sheet"));
    EXPECT_EQ(json["page"], 1);
    EXPECT_EQ(json["next_page_url"], "/file/single.xlsx?page=2");
}

TEST_F(RequestRouterTest, SheetSelectionModes) {
    RequestRouter strict = makeRouter();
    HttpResponse rejected = strict.handle(get("/file/sales.xlsx"));
    EXPECT_EQ(rejected.status, 400);

    RequestRouter lenient = makeRouter("1000 per minute", "first-sheet");
    HttpResponse accepted = lenient.handle(get("/file/sales.xlsx"));
    ASSERT_EQ(accepted.status, 200) << accepted.body;
    EXPECT_EQ(body(accepted)["data"][0]["Name"], "Alice");
}

TEST_F(RequestRouterTest, InvalidPageValues) {
    RequestRouter router = makeRouter();
    for (const char* page : {"0", "-1", "abc", "1.5", "2x", ""}) {
        HttpResponse response = router.handle(get(std::string("/file/single.xlsx?page=") + page));
        EXPECT_EQ(response.status, 400) << "page=" << page;
        EXPECT_EQ(body(response)["error"], "Invalid page value");
    }
}

TEST_F(RequestRouterTest, MissingFileTakesPrecedenceOverBadPage) {
    RequestRouter router = makeRouter();
    HttpResponse response = router.handle(get("/file/missing.xlsx?page=0"));
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(body(response)["error"], "File not found");
}

TEST_F(RequestRouterTest, SheetNotFound) {
    RequestRouter router = makeRouter();
    HttpResponse response = router.handle(get("/file/sales.xlsx/sheet/Ghost"));
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(body(response)["error"], "Sheet 'Ghost' not found");
}

TEST_F(RequestRouterTest, PathTraversalIsNotFound) {
    RequestRouter router = makeRouter();
    EXPECT_EQ(router.handle(get("/file/..%2Fsales.xlsx")).status, 404);
    EXPECT_EQ(router.handle(get("/file/%2E%2E")).status, 404);
}

TEST_F(RequestRouterTest, UnreadableWorkbook) {
    RequestRouter router = makeRouter();
    HttpResponse response = router.handle(get("/file/broken.xlsx"));
    EXPECT_EQ(response.status, 500);
    std::string error = body(response)["error"];
    EXPECT_EQ(error.rfind("Could not load data: ", 0), 0u);
}

TEST_F(RequestRouterTest, RoutingErrors) {
    RequestRouter router = makeRouter();

    HttpResponse unknown = router.handle(get("/nope"));
    EXPECT_EQ(unknown.status, 404);
    EXPECT_EQ(body(unknown)["error"], "Not found");

    EXPECT_EQ(router.handle(get("/file/sales.xlsx/extra/segments/here")).status, 404);

    HttpRequest post = get("/files");
    post.method = "POST";
    EXPECT_EQ(router.handle(post).status, 405);

    HttpResponse bad_path = router.handle(get("/file/bad%zz.xlsx"));
    EXPECT_EQ(bad_path.status, 400);
    EXPECT_EQ(body(bad_path)["error"], "Malformed request path");

    HttpResponse bad_query = router.handle(get("/file/single.xlsx?page=%zz"));
    EXPECT_EQ(bad_query.status, 400);
    EXPECT_EQ(body(bad_query)["error"], "Malformed query string");
}

TEST(PageParameterTest, Parse) {
    EXPECT_EQ(RequestRouter::parsePageParameter(std::nullopt).value(), 1);
    EXPECT_EQ(RequestRouter::parsePageParameter(std::string("3")).value(), 3);
    EXPECT_EQ(RequestRouter::parsePageParameter(std::string(" 7 ")).value(), 7);
    EXPECT_EQ(RequestRouter::parsePageParameter(std::string("+2")).value(), 2);

    EXPECT_FALSE(RequestRouter::parsePageParameter(std::string("0")));
    EXPECT_FALSE(RequestRouter::parsePageParameter(std::string("")));
    EXPECT_FALSE(RequestRouter::parsePageParameter(std::string("99999999999999999999")));
    EXPECT_EQ(RequestRouter::parsePageParameter(std::string("x")).error().code,
              core::ErrorCode::InvalidArgument);
}

TEST(PageSerializerTest, CellValues) {
    core::DateTime dt;
    dt.year = 2024;
    dt.month = 5;
    dt.day = 6;
    dt.hour = 7;

    EXPECT_TRUE(PageSerializer::toJson(core::CellValue{}).is_null());
    EXPECT_EQ(PageSerializer::toJson(core::CellValue(dt)), "2024-05-06T07:00:00");
    EXPECT_EQ(PageSerializer::toJson(core::CellValue(int64_t(-3))), -3);
    EXPECT_EQ(PageSerializer::toJson(core::CellValue(true)), true);
}

TEST(PageSerializerTest, DuplicateFieldLaterWins) {
    core::Record record{{"x", core::CellValue(int64_t(1))}, {"y", core::CellValue{}},
                        {"x", core::CellValue(int64_t(2))}};
    EXPECT_EQ(PageSerializer::dump(PageSerializer::toJson(record)), "{\"x\":2,\"y\":null}");
}

TEST(PageSerializerTest, InvalidUtf8IsReplaced) {
    std::string text = "bad\xff";
    std::string dumped = PageSerializer::dump(PageSerializer::error(text));
    EXPECT_NE(dumped.find("\xEF\xBF\xBD"), std::string::npos);
}

}} // namespace excelpager::server
