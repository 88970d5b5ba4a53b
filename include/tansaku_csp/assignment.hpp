/**
 * @file assignment.hpp
 * @brief 部分割り当て（変数インデックス -> 値）
 */
#ifndef TANSAKU_CSP_ASSIGNMENT_HPP
#define TANSAKU_CSP_ASSIGNMENT_HPP

#include "tansaku_csp/domain.hpp"
#include <optional>
#include <vector>
#include <cstddef>

namespace tansaku_csp {

/**
 * @brief 探索状態を表す部分割り当て
 *
 * Sudoku では盤面そのもの（未記入マス = 未割り当て）、
 * 地図彩色では塗り終えた領域の集合に相当する。
 */
class Assignment {
public:
    Assignment() = default;
    explicit Assignment(size_t num_variables)
        : values_(num_variables) {}

    /**
     * @brief 未割り当ての変数を追加
     * @return 変数インデックス
     */
    size_t add_variable() {
        values_.emplace_back();
        return values_.size() - 1;
    }

    size_t num_variables() const { return values_.size(); }

    /**
     * @brief 割り当て済みの変数の数（O(1)）
     */
    size_t assigned_count() const { return assigned_count_; }

    /**
     * @brief 全変数が割り当て済みか
     */
    bool is_complete() const { return assigned_count_ == values_.size(); }

    bool is_assigned(size_t var_idx) const { return values_[var_idx].has_value(); }

    /**
     * @brief 割り当てられた値を取得（未割り当てなら std::nullopt）
     */
    const std::optional<Domain::value_type>& value(size_t var_idx) const { return values_[var_idx]; }

    void assign(size_t var_idx, Domain::value_type value) {
        if (!values_[var_idx]) {
            ++assigned_count_;
        }
        values_[var_idx] = value;
    }

    void unassign(size_t var_idx) {
        if (values_[var_idx]) {
            --assigned_count_;
            values_[var_idx].reset();
        }
    }

    bool operator==(const Assignment& other) const { return values_ == other.values_; }
    bool operator!=(const Assignment& other) const { return !(*this == other); }

private:
    std::vector<std::optional<Domain::value_type>> values_;
    size_t assigned_count_ = 0;
};

} // namespace tansaku_csp

#endif // TANSAKU_CSP_ASSIGNMENT_HPP
