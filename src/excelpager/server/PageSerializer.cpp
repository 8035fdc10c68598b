#include "excelpager/server/PageSerializer.hpp"
#include <variant>

namespace excelpager {
namespace server {

namespace {

struct JsonVisitor {
    Json operator()(std::monostate) const { return nullptr; }
    Json operator()(const std::string& text) const { return text; }
    Json operator()(int64_t number) const { return number; }
    Json operator()(double number) const { return number; }
    Json operator()(bool flag) const { return flag; }
    Json operator()(const core::DateTime& dt) const { return dt.toIsoString(); }
};

} // namespace

Json PageSerializer::toJson(const core::CellValue& value) {
    return std::visit(JsonVisitor{}, value);
}

Json PageSerializer::toJson(const core::Record& record) {
    Json object = Json::object();
    for (const auto& field : record) {
        object[field.name] = toJson(field.value);
    }
    return object;
}

Json PageSerializer::toJson(const paging::Page& page) {
    Json json = Json::object();
    json["file"] = page.file;
    if (page.sheet) {
        json["sheet"] = *page.sheet;
    }
    json["page"] = page.page;
    json["per_page"] = page.per_page;
    json["total_rows"] = page.total_rows;
    json["total_pages"] = page.total_pages;
    json["has_more"] = page.has_more;
    json["next_page"] = page.next_page ? Json(*page.next_page) : Json(nullptr);
    json["next_page_url"] = page.next_page_url ? Json(*page.next_page_url) : Json(nullptr);

    Json data = Json::array();
    for (const auto& record : page.records) {
        data.push_back(toJson(record));
    }
    json["data"] = std::move(data);
    return json;
}

Json PageSerializer::files(const std::vector<std::string>& files) {
    Json json = Json::object();
    json["files"] = files;
    return json;
}

Json PageSerializer::sheets(const std::string& file, const std::vector<std::string>& sheets) {
    Json json = Json::object();
    json["file"] = file;
    json["sheets"] = sheets;
    return json;
}

Json PageSerializer::error(const std::string& message) {
    Json json = Json::object();
    json["error"] = message;
    return json;
}

std::string PageSerializer::dump(const Json& json) {
    return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

}} // namespace excelpager::server
