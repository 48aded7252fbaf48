#include "mz/net/http_client.hpp"

#include "mz/util/text.hpp"

namespace mz::net {

std::string http_response::header(const std::string& name) const
{
    const std::string wanted = util::to_lower(name);
    for (const auto& [k, v] : headers) {
        if (util::to_lower(k) == wanted) {
            return v;
        }
    }
    return {};
}

} // namespace mz::net
