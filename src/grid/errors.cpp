#include "grid/errors.hpp"

namespace grid {

std::string join_reasons(const std::vector<std::string>& reasons) {
    std::string joined;
    for (const auto& reason : reasons) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += reason;
    }
    return joined;
}

} // namespace grid
