#pragma once

#include <string>
#include <string_view>

namespace excelpager {
namespace server {

/**
 * @brief Bearer 令牌校验，比较时间与令牌内容无关
 */
class Authenticator {
public:
    explicit Authenticator(std::string api_key) : expected_("Bearer " + std::move(api_key)) {}

    /**
     * @param authorization Authorization 请求头的原始值
     */
    bool authorize(std::string_view authorization) const;

private:
    std::string expected_;
};

}} // namespace excelpager::server
