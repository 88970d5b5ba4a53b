/**
 * @file selector.hpp
 * @brief 分岐変数の選択（静的順序 / MRV）
 */
#ifndef TANSAKU_CSP_SELECTOR_HPP
#define TANSAKU_CSP_SELECTOR_HPP

#include "tansaku_csp/assignment.hpp"
#include "tansaku_csp/domain_store.hpp"

namespace tansaku_csp {

/**
 * @brief 変数選択ポリシー
 */
enum class SelectionPolicy {
    Static,  // インデックス順で最初の未割り当て変数
    MRV      // 定義域が最小の未割り当て変数（同サイズならインデックス最小）
};

/**
 * @brief インデックス順で最初の未割り当て変数を選ぶ
 * @return 変数インデックス、全て割り当て済みなら SIZE_MAX
 */
size_t select_first_unassigned(const Assignment& assignment);

/**
 * @brief Minimum-Remaining-Values で変数を選ぶ
 *
 * 定義域サイズ 0 の変数を見つけた時点でそれを返す（呼び出し側で即失敗できる）。
 * サイズ 1 はそれより小さいものが存在しないため、最初に見つかった時点で返す。
 *
 * @return 変数インデックス、全て割り当て済みなら SIZE_MAX
 */
size_t select_mrv(const Assignment& assignment, const DomainStore& domains);

/**
 * @brief ポリシーに従って次に分岐する変数を選ぶ
 */
size_t select_variable(SelectionPolicy policy, const Assignment& assignment,
                       const DomainStore& domains);

} // namespace tansaku_csp

#endif // TANSAKU_CSP_SELECTOR_HPP
