#include "tansaku_csp/constraint.hpp"

namespace tansaku_csp {

bool Constraint::is_consistent(const Assignment& assignment,
                               size_t var_idx, Domain::value_type value) const {
    for (size_t peer : peers(var_idx)) {
        const auto& peer_value = assignment.value(peer);
        if (peer_value && *peer_value == value) {
            return false;
        }
    }
    return true;
}

std::optional<bool> Constraint::is_satisfied(const Assignment& assignment) const {
    if (!assignment.is_complete()) {
        return std::nullopt;
    }
    for (size_t i = 0; i < num_variables(); ++i) {
        if (!is_consistent(assignment, i, *assignment.value(i))) {
            return false;
        }
    }
    return true;
}

} // namespace tansaku_csp
