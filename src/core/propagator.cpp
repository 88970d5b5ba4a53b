#include "tansaku_csp/propagator.hpp"

namespace tansaku_csp {

bool forward_check(const Constraint& constraint, size_t var_idx, Domain::value_type value,
                   DomainStore& domains, const Assignment& assignment, PruningRecord& record) {
    for (size_t peer : constraint.peers(var_idx)) {
        if (assignment.is_assigned(peer)) {
            continue;
        }
        if (domains.prune(peer, value, record) && domains.size(peer) == 0) {
            return false;  // domain wipeout
        }
    }
    return true;
}

} // namespace tansaku_csp
