/**
 * @file types.cpp
 * @brief String parsing for vocabulary types.
 */

#include "core/types.hpp"

namespace agent_dispatch {

std::optional<Priority> parse_priority(std::string_view text) noexcept {
    for (auto p : kAllPriorities) {
        if (to_string(p) == text) return p;
    }
    return std::nullopt;
}

}  // namespace agent_dispatch
