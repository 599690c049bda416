#include "core/types.hpp"

#include <algorithm>

namespace rlsengine {

std::vector<std::string> UserSecurityContext::sorted_roles() const {
    std::vector<std::string> result(roles.begin(), roles.end());
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace rlsengine
