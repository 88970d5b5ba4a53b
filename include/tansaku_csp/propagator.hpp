/**
 * @file propagator.hpp
 * @brief 前方検査（forward checking）
 */
#ifndef TANSAKU_CSP_PROPAGATOR_HPP
#define TANSAKU_CSP_PROPAGATOR_HPP

#include "tansaku_csp/assignment.hpp"
#include "tansaku_csp/constraint.hpp"
#include "tansaku_csp/domain_store.hpp"

namespace tansaku_csp {

/**
 * @brief var_idx = value を割り当てた直後の前方検査
 *
 * 未割り当ての peer の定義域から value を除去し、(peer, value) を record に追記する。
 * var_idx 自身の定義域には触れない（呼び出し側が事前に {value} へ縮める）。
 *
 * @return peer の定義域が空になったら false（残りの peer は走査しない）。
 *         その時点までの除去は record に残っているので、呼び出し側が undo すること。
 */
bool forward_check(const Constraint& constraint, size_t var_idx, Domain::value_type value,
                   DomainStore& domains, const Assignment& assignment, PruningRecord& record);

} // namespace tansaku_csp

#endif // TANSAKU_CSP_PROPAGATOR_HPP
