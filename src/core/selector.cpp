#include "tansaku_csp/selector.hpp"

namespace tansaku_csp {

size_t select_first_unassigned(const Assignment& assignment) {
    for (size_t i = 0; i < assignment.num_variables(); ++i) {
        if (!assignment.is_assigned(i)) {
            return i;
        }
    }
    return SIZE_MAX;
}

size_t select_mrv(const Assignment& assignment, const DomainStore& domains) {
    size_t best_idx = SIZE_MAX;
    size_t min_domain_size = SIZE_MAX;

    // インデックス昇順に走査し、厳密に小さい場合のみ更新する（= 同サイズは先勝ち）
    for (size_t i = 0; i < assignment.num_variables(); ++i) {
        if (assignment.is_assigned(i)) {
            continue;
        }
        size_t domain_size = domains.size(i);
        if (domain_size == 0) {
            return i;  // wipeout: 即座に失敗させる
        }
        if (domain_size < min_domain_size) {
            min_domain_size = domain_size;
            best_idx = i;
            if (domain_size == 1) {
                return best_idx;
            }
        }
    }

    return best_idx;
}

size_t select_variable(SelectionPolicy policy, const Assignment& assignment,
                       const DomainStore& domains) {
    switch (policy) {
    case SelectionPolicy::MRV:
        return select_mrv(assignment, domains);
    case SelectionPolicy::Static:
        break;
    }
    return select_first_unassigned(assignment);
}

} // namespace tansaku_csp
