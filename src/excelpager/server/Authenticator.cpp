#include "excelpager/server/Authenticator.hpp"

namespace excelpager {
namespace server {

bool Authenticator::authorize(std::string_view authorization) const {
    unsigned char diff = authorization.size() == expected_.size() ? 0 : 1;
    for (size_t i = 0; i < expected_.size(); ++i) {
        unsigned char given = i < authorization.size() ? static_cast<unsigned char>(authorization[i]) : 0;
        diff |= given ^ static_cast<unsigned char>(expected_[i]);
    }
    return diff == 0;
}

}} // namespace excelpager::server
