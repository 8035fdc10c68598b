#pragma once

#include "excelpager/core/Config.hpp"
#include "excelpager/core/Expected.hpp"
#include "excelpager/locator/SheetLocator.hpp"
#include "excelpager/paging/RowPaginator.hpp"
#include "excelpager/server/Authenticator.hpp"
#include "excelpager/server/RateLimiter.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace excelpager {
namespace server {

/**
 * @brief 与传输层无关的请求
 */
struct HttpRequest {
    std::string method = "GET";
    std::string target;           // 路径加查询串，如 "/file/a.xlsx?page=2"
    std::string authorization;    // Authorization 头
    std::string client;           // 客户端地址，用于限流
};

struct HttpResponse {
    int status = 200;
    std::string body;             // JSON
    std::optional<int64_t> retry_after;
};

/**
 * @brief 路由与边界处理
 *
 * 顺序：限流 -> 鉴权 -> 参数解析 -> 定位器/分页器 -> 序列化。
 * 错误统一为 {"error": "..."}，状态码由 ErrorCode 决定。
 */
class RequestRouter {
public:
    explicit RequestRouter(const core::ServiceConfig& config);

    HttpResponse handle(const HttpRequest& request);

    /**
     * @brief 解析 page 查询参数（缺省为1，允许首尾空白与正号）
     * @return 非整数或小于1时 InvalidArgument
     */
    static core::Result<int64_t> parsePageParameter(const std::optional<std::string>& text);

    /**
     * @brief 错误到响应的映射（读取类错误前缀 "Could not load data: "）
     */
    static HttpResponse errorResponse(const core::Error& error);

private:
    enum class Route { Files, SingleSheet, Sheets, Sheet };

    struct Match {
        Route route;
        std::string file;
        std::optional<std::string> sheet;
    };

    locator::SheetLocator locator_;
    paging::RowPaginator paginator_;
    Authenticator authenticator_;
    RateLimiter rate_limiter_;
    core::SheetSelectionMode selection_mode_;
    std::chrono::milliseconds request_timeout_;

    core::Result<std::optional<Match>> match(const std::string& path) const;
    HttpResponse dispatch(const Match& match, const std::optional<std::string>& page_text);
    HttpResponse handlePage(const Match& match, const std::optional<std::string>& page_text);

    static HttpResponse errorResponse(int status, const std::string& message);
};

}} // namespace excelpager::server
