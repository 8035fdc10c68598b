/**
 * @file RequestRouter.cpp
 * @brief 路由、鉴权、限流与错误映射
 */

#include "excelpager/server/RequestRouter.hpp"
#include "excelpager/server/PageSerializer.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include "excelpager/utils/UrlCodec.hpp"
#include <cctype>
#include <charconv>

namespace excelpager {
namespace server {

namespace {

std::vector<std::string_view> splitPath(std::string_view path) {
    std::vector<std::string_view> segments;
    if (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos) {
            slash = path.size();
        }
        segments.push_back(path.substr(pos, slash - pos));
        pos = slash + 1;
    }
    return segments;
}

} // namespace

RequestRouter::RequestRouter(const core::ServiceConfig& config)
    : locator_(config.dataDir())
    , paginator_(config.perPage(), config.rowCountMode())
    , authenticator_(config.apiKey())
    , rate_limiter_(config.rateLimit())
    , selection_mode_(config.sheetSelection())
    , request_timeout_(config.requestTimeout()) {}

core::Result<int64_t> RequestRouter::parsePageParameter(const std::optional<std::string>& text) {
    if (!text) {
        return int64_t(1);
    }

    std::string_view value(*text);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);
    if (!value.empty() && value.front() == '+') {
        value.remove_prefix(1);
    }

    int64_t page = 0;
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), last, page);
    if (value.empty() || ec != std::errc() || ptr != last || page < 1) {
        return core::Error(core::ErrorCode::InvalidArgument, "Invalid page value");
    }
    return page;
}

core::Result<std::optional<RequestRouter::Match>> RequestRouter::match(const std::string& path) const {
    std::vector<std::string> segments;
    for (auto raw : splitPath(path)) {
        auto decoded = utils::UrlCodec::decode(raw);
        if (!decoded) {
            return core::Error(core::ErrorCode::InvalidArgument, "Malformed request path");
        }
        segments.push_back(std::move(*decoded));
    }

    std::optional<Match> result;
    if (segments.size() == 1 && segments[0] == "files") {
        result = Match{Route::Files, std::string(), std::nullopt};
    } else if (segments.size() >= 2 && segments[0] == "file" && !segments[1].empty()) {
        if (segments.size() == 2) {
            result = Match{Route::SingleSheet, segments[1], std::nullopt};
        } else if (segments.size() == 3 && segments[2] == "sheets") {
            result = Match{Route::Sheets, segments[1], std::nullopt};
        } else if (segments.size() == 4 && segments[2] == "sheet" && !segments[3].empty()) {
            result = Match{Route::Sheet, segments[1], segments[3]};
        }
    }
    return result;
}

HttpResponse RequestRouter::handle(const HttpRequest& request) {
    int64_t retry_after = 0;
    if (!rate_limiter_.allow(request.client, RateLimiter::Clock::now(), retry_after)) {
        SERVER_WARN("Rate limit exceeded for {}", request.client);
        HttpResponse response = errorResponse(core::Error(core::ErrorCode::RateLimited, "Rate limit exceeded"));
        response.retry_after = retry_after;
        return response;
    }

    if (!authenticator_.authorize(request.authorization)) {
        SERVER_INFO("Unauthorized request from {} for {}", request.client, request.target);
        return errorResponse(core::Error(core::ErrorCode::Unauthorized, "Unauthorized"));
    }

    std::string_view target(request.target);
    std::string_view query;
    size_t question = target.find('?');
    if (question != std::string_view::npos) {
        query = target.substr(question + 1);
        target = target.substr(0, question);
    }

    auto matched = match(std::string(target));
    if (!matched) {
        return errorResponse(matched.error());
    }
    if (!*matched) {
        return errorResponse(core::Error(core::ErrorCode::RouteNotFound, "Not found"));
    }
    if (request.method != "GET") {
        return errorResponse(core::Error(core::ErrorCode::MethodNotAllowed, "Method not allowed"));
    }

    auto params = utils::UrlCodec::parseQuery(query);
    if (!params) {
        return errorResponse(core::Error(core::ErrorCode::InvalidArgument, "Malformed query string"));
    }
    std::optional<std::string> page_text;
    auto page_it = params->find("page");
    if (page_it != params->end()) {
        page_text = page_it->second;
    }

    return dispatch(**matched, page_text);
}

HttpResponse RequestRouter::dispatch(const Match& match, const std::optional<std::string>& page_text) {
    switch (match.route) {
        case Route::Files: {
            HttpResponse response;
            response.body = PageSerializer::dump(PageSerializer::files(locator_.listFiles()));
            return response;
        }
        case Route::Sheets: {
            auto sheets = locator_.listSheets(match.file);
            if (!sheets) {
                return errorResponse(sheets.error());
            }
            HttpResponse response;
            response.body = PageSerializer::dump(PageSerializer::sheets(match.file, *sheets));
            return response;
        }
        case Route::SingleSheet:
        case Route::Sheet:
        default:
            return handlePage(match, page_text);
    }
}

HttpResponse RequestRouter::handlePage(const Match& match, const std::optional<std::string>& page_text) {
    // 文件不存在优先于参数错误
    auto resolved = locator_.resolveFile(match.file);
    if (!resolved) {
        return errorResponse(resolved.error());
    }

    auto page = parsePageParameter(page_text);
    if (!page) {
        return errorResponse(page.error());
    }

    auto handle = locator_.openSheet(match.file, match.sheet, selection_mode_);
    if (!handle) {
        return errorResponse(handle.error());
    }

    auto token = core::CancellationToken::withTimeout(request_timeout_);
    auto result = paginator_.fetchPage(*handle, *page, match.sheet.has_value(), token);
    if (!result) {
        return errorResponse(result.error());
    }

    HttpResponse response;
    response.body = PageSerializer::dump(PageSerializer::toJson(*result));
    return response;
}

HttpResponse RequestRouter::errorResponse(const core::Error& error) {
    const int status = core::httpStatusFor(error.code);
    switch (core::kindOf(error.code)) {
        case core::ErrorKind::Unreadable:
        case core::ErrorKind::ReadFailure:
        case core::ErrorKind::Internal:
            SERVER_ERROR("Request failed: {}", error.fullMessage());
            return errorResponse(status, "Could not load data: " + error.message);
        case core::ErrorKind::Cancelled:
            SERVER_WARN("Request cancelled: {}", error.fullMessage());
            return errorResponse(status, "Request timed out");
        default:
            SERVER_DEBUG("Request rejected ({}): {}", status, error.fullMessage());
            return errorResponse(status, error.message);
    }
}

HttpResponse RequestRouter::errorResponse(int status, const std::string& message) {
    HttpResponse response;
    response.status = status;
    response.body = PageSerializer::dump(PageSerializer::error(message));
    return response;
}

}} // namespace excelpager::server
