/**
 * @file model.hpp
 * @brief CSPモデルクラス（変数・定義域・割り当て・制約の管理）
 */
#ifndef TANSAKU_CSP_MODEL_HPP
#define TANSAKU_CSP_MODEL_HPP

#include "tansaku_csp/assignment.hpp"
#include "tansaku_csp/constraint.hpp"
#include "tansaku_csp/domain_store.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace tansaku_csp {

/**
 * @brief CSPモデル
 *
 * 変数はインデックスで識別され、インデックス順が変数の全順序となる
 * （MRV のタイブレークや Static 選択はこの順に従う）。
 * 探索中の定義域と割り当てはモデル自身が保持し、ソルバーが直接変更する。
 */
class Model {
public:
    Model() = default;

    // ===== 変数・制約管理 =====

    /**
     * @brief 変数を作成して登録
     * @param name 変数名（モデル内で一意）
     * @param domain 定義域
     * @return 変数インデックス
     */
    size_t create_variable(std::string name, Domain domain);

    /**
     * @brief 区間ドメインの変数を作成して登録
     */
    size_t create_variable(std::string name, Domain::value_type min, Domain::value_type max);

    /**
     * @brief 値が固定された変数を作成して登録
     *
     * 定義域は {value}、割り当ても最初から value になる。
     */
    size_t create_variable(std::string name, Domain::value_type value);

    /**
     * @brief 制約を追加
     *
     * 制約の変数数はモデルの変数数と一致していなければならない。
     * 変数を全て作成してから追加すること。
     */
    void add_constraint(ConstraintPtr constraint);

    size_t num_variables() const { return names_.size(); }

    const std::string& variable_name(size_t var_idx) const;

    /**
     * @brief 名前から変数インデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t find_variable_index(const std::string& name) const;

    const std::vector<ConstraintPtr>& constraints() const { return constraints_; }

    /**
     * @brief 値の表示名を設定（値 v の表示名は labels[v]）
     *
     * 地図彩色で値（パレット内インデックス）を色名で表示するために使う。
     */
    void set_value_labels(std::vector<std::string> labels) { value_labels_ = std::move(labels); }

    /**
     * @brief 値を表示用文字列に変換（表示名がなければ数値）
     */
    std::string format_value(Domain::value_type value) const;

    // ===== 探索状態 =====

    DomainStore& domains() { return domains_; }
    const DomainStore& domains() const { return domains_; }

    Assignment& assignment() { return assignment_; }
    const Assignment& assignment() const { return assignment_; }

    /**
     * @brief 全制約について var_idx = value が現在の割り当てと整合するか
     */
    bool is_consistent(size_t var_idx, Domain::value_type value) const;

    /**
     * @brief 現在の割り当てが全制約を満たす完全割り当てか
     */
    bool is_solution() const;

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, size_t> name_to_id_;
    std::vector<ConstraintPtr> constraints_;
    std::vector<std::string> value_labels_;
    DomainStore domains_;
    Assignment assignment_;
};

} // namespace tansaku_csp

#endif // TANSAKU_CSP_MODEL_HPP
