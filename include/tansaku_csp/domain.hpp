/**
 * @file domain.hpp
 * @brief 整数定義域クラス（Sparse Set ベース）
 */
#ifndef TANSAKU_CSP_DOMAIN_HPP
#define TANSAKU_CSP_DOMAIN_HPP

#include <vector>
#include <cstdint>
#include <cstddef>

namespace tansaku_csp {

/**
 * @brief 整数定義域を表すクラス
 *
 * Sparse Set を使用し、O(1) での値の存在確認・削除・再挿入を実現する。
 * 削除された値は dense 配列の [n_, capacity) に残るため、
 * 削除と逆順に restore() すれば集合として元の状態に戻る。
 */
class Domain {
public:
    using value_type = int64_t;

    /**
     * @brief 空の定義域を作成
     */
    Domain();

    /**
     * @brief 区間定義域を作成
     * @param min 最小値
     * @param max 最大値
     */
    Domain(value_type min, value_type max);

    /**
     * @brief 値リストから定義域を作成（重複は除去される）
     * @param values 定義域に含める値のリスト
     */
    explicit Domain(std::vector<value_type> values);

    /**
     * @brief 定義域が空かどうか
     */
    bool empty() const { return n_ == 0; }

    /**
     * @brief 定義域のサイズを取得
     */
    size_t size() const { return n_; }

    /**
     * @brief 単一値に固定されているか
     */
    bool is_singleton() const { return n_ == 1; }

    /**
     * @brief 値が定義域に含まれるか
     */
    bool contains(value_type value) const;

    /**
     * @brief 値を削除
     * @return 値が含まれていて削除されたらtrue（空になる場合も削除する）
     */
    bool remove(value_type value);

    /**
     * @brief 削除済みの値を再挿入
     * @return 再挿入されたらtrue、既に含まれている・初期値でない場合はfalse
     */
    bool restore(value_type value);

    /**
     * @brief 全ての有効な値を昇順で取得
     */
    std::vector<value_type> values() const;

    /**
     * @brief 初期定義域に含まれていた値の数
     */
    size_t capacity() const { return values_.size(); }

    /**
     * @brief 集合として等しいか
     */
    bool operator==(const Domain& other) const;
    bool operator!=(const Domain& other) const { return !(*this == other); }

private:
    size_t index_of(value_type value) const;
    void swap_at(size_t i, size_t j);

    std::vector<value_type> values_;  // Dense 配列
    std::vector<size_t> sparse_;      // フラット sparse 配列（sparse_[val - offset_] = index）
    value_type offset_;               // = 初期 min 値
    size_t n_;                        // 有効な値の数
};

} // namespace tansaku_csp

#endif // TANSAKU_CSP_DOMAIN_HPP
