/**
 * @file constraint.hpp
 * @brief 制約基底クラス（2変数間の不等号制約グラフ）
 */
#ifndef TANSAKU_CSP_CONSTRAINT_HPP
#define TANSAKU_CSP_CONSTRAINT_HPP

#include "tansaku_csp/assignment.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tansaku_csp {

/**
 * @brief 制約の基底クラス
 *
 * 変数間の「異なる値を取る」制約を、各変数の peer（隣接変数）リストとして表す。
 * peer 関係は対称で、自己ループを含まない。
 *
 * - Constraint Oracle: is_consistent() で候補値の整合性を判定する
 * - 前方検査: peers() で値を除去する対象を列挙する
 */
class Constraint {
public:
    virtual ~Constraint() = default;

    /**
     * @brief 制約の名前を取得
     */
    virtual std::string name() const = 0;

    /**
     * @brief 制約が扱う変数の数
     */
    virtual size_t num_variables() const = 0;

    /**
     * @brief 変数 var_idx と異なる値を取るべき変数のリスト
     */
    virtual const std::vector<size_t>& peers(size_t var_idx) const = 0;

    /**
     * @brief var_idx に value を割り当てても矛盾しないか
     *
     * 割り当て済みの peer が既に value を持っていれば false。
     * var_idx 自身の現在の値は無視する。副作用なし。
     */
    virtual bool is_consistent(const Assignment& assignment,
                               size_t var_idx, Domain::value_type value) const;

    /**
     * @brief 制約が満たされているか確認
     * @return 満たされていればtrue、違反していればfalse、
     *         未割り当ての変数があればstd::nullopt
     */
    std::optional<bool> is_satisfied(const Assignment& assignment) const;
};

using ConstraintPtr = std::shared_ptr<Constraint>;

} // namespace tansaku_csp

#endif // TANSAKU_CSP_CONSTRAINT_HPP
