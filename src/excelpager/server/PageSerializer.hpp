#pragma once

#include "excelpager/core/CellValue.hpp"
#include "excelpager/paging/Page.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace excelpager {
namespace server {

using Json = nlohmann::ordered_json;

/**
 * @brief 响应体的JSON序列化
 *
 * 日期为ISO-8601字符串，缺失值为 null；记录按表头顺序输出，重名字段后者覆盖前者。
 */
class PageSerializer {
public:
    static Json toJson(const core::CellValue& value);
    static Json toJson(const core::Record& record);
    static Json toJson(const paging::Page& page);

    static Json files(const std::vector<std::string>& files);
    static Json sheets(const std::string& file, const std::vector<std::string>& sheets);
    static Json error(const std::string& message);

    /**
     * @brief 输出紧凑JSON，无效UTF-8字节以替换字符输出
     */
    static std::string dump(const Json& json);
};

}} // namespace excelpager::server
