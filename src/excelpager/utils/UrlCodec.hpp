#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace excelpager {
namespace utils {

/**
 * @brief URL百分号编码工具
 */
class UrlCodec {
public:
    /**
     * @brief 编码单个路径分量（除 RFC 3986 非保留字符外全部编码，包括 '/'）
     */
    static std::string encodePathSegment(std::string_view text);

    /**
     * @brief 解码百分号转义
     * @param plus_as_space 查询参数中 '+' 表示空格
     * @return 转义无效（如 "%G1"、末尾的 "%"）时返回 std::nullopt
     */
    static std::optional<std::string> decode(std::string_view text, bool plus_as_space = false);

    /**
     * @brief 解析查询串 "a=1&b=2"；同名参数取第一个
     * @return 任意键或值解码失败时返回 std::nullopt
     */
    static std::optional<std::map<std::string, std::string>> parseQuery(std::string_view query);
};

}} // namespace excelpager::utils
