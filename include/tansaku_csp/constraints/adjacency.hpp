/**
 * @file adjacency.hpp
 * @brief 隣接制約（隣り合う変数は異なる値）
 */
#ifndef TANSAKU_CSP_CONSTRAINTS_ADJACENCY_HPP
#define TANSAKU_CSP_CONSTRAINTS_ADJACENCY_HPP

#include "tansaku_csp/constraint.hpp"

namespace tansaku_csp {

/**
 * @brief 明示的な隣接リストで与えられる制約グラフ（地図彩色）
 *
 * 隣接リストは対称・自己ループなしであることを前提とする。
 * 各リストは昇順・重複なしに正規化される。
 */
class AdjacencyConstraint : public Constraint {
public:
    explicit AdjacencyConstraint(std::vector<std::vector<size_t>> adjacency);

    std::string name() const override;
    size_t num_variables() const override { return adjacency_.size(); }
    const std::vector<size_t>& peers(size_t var_idx) const override { return adjacency_[var_idx]; }

    /**
     * @brief 隣接ペア (a, b), a < b の数
     */
    size_t num_edges() const;

private:
    std::vector<std::vector<size_t>> adjacency_;
};

} // namespace tansaku_csp

#endif // TANSAKU_CSP_CONSTRAINTS_ADJACENCY_HPP
