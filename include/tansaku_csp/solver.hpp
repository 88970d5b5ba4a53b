/**
 * @file solver.hpp
 * @brief CSPソルバークラス（バックトラック探索、前方検査、MRV変数選択）
 */
#ifndef TANSAKU_CSP_SOLVER_HPP
#define TANSAKU_CSP_SOLVER_HPP

#include "tansaku_csp/model.hpp"
#include "tansaku_csp/selector.hpp"
#include <atomic>
#include <optional>

namespace tansaku_csp {

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった
    UNSAT,    // 解が存在しない（全分岐を探索済み）
    UNKNOWN   // 不明（停止要求・ノード数上限）
};

/**
 * @brief ソルバー統計情報
 *
 * solve() の開始時にリセットされる。探索の制御には使わない。
 */
struct SolverStats {
    size_t assignments = 0;   // 試行した割り当ての数
    size_t backtracks = 0;    // 割り当てを取り消した回数
    size_t max_depth = 0;
    double elapsed_seconds = 0.0;
};

/**
 * @brief CSPソルバー
 *
 * 深さ優先のバックトラック探索。オプションで以下を使用する：
 * - 前方検査（割り当てた値を peer の定義域から除去し、空になれば即失敗）
 * - MRV 変数選択
 *
 * 定義域と割り当てはモデル上で直接変更し、PruningRecord で正確に元に戻す。
 * 解が見つかった場合、モデルの割り当ては解のまま残る。
 * 見つからなかった場合、モデルは solve() 呼び出し前の状態に戻る。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 最初の解を探索
     * @param model 解くモデル
     * @return 解が見つかればその割り当て、なければstd::nullopt
     */
    std::optional<Assignment> solve(Model& model);

    /**
     * @brief 直前の solve() の結果
     */
    SearchResult last_result() const { return last_result_; }

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief 前方検査を有効/無効にする
     */
    void set_forward_checking(bool enabled) { forward_checking_ = enabled; }

    /**
     * @brief 変数選択ポリシーを設定する
     */
    void set_selection_policy(SelectionPolicy policy) { selection_policy_ = policy; }

    /**
     * @brief 割り当て試行回数の上限（0 = 無制限）
     *
     * 上限に達すると探索を打ち切り SearchResult::UNKNOWN を返す。
     */
    void set_node_limit(size_t limit) { node_limit_ = limit; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    std::atomic<bool> stopped_{false};
    bool verbose_ = false;

    // ===== 探索 =====

    /**
     * @brief presolve（探索前の初期チェックと伝播）
     *
     * 固定済み変数どうしの矛盾を検出し、固定済みの値を peer の定義域から
     * 除去する（除去は root_record に記録）。前方検査なしでも行うので、
     * MRV は初期状態の候補数で変数を選べる。
     *
     * @return 矛盾がなければtrue
     */
    bool presolve(Model& model, PruningRecord& root_record);

    /**
     * @brief 再帰探索
     */
    SearchResult run_search(Model& model, size_t depth);

    /**
     * @brief 割り当て直後の伝播（定義域の縮小 + 前方検査）
     * @return wipeout が起きなければtrue。失敗時も record は undo が必要
     */
    bool propagate_assignment(Model& model, size_t var_idx, Domain::value_type value,
                              PruningRecord& record);

    /**
     * @brief 試行した割り当てを取り消す（伝播の undo → 割り当て解除）
     */
    void backtrack(Model& model, size_t var_idx, const PruningRecord& record);

    // ===== メンバ変数 =====

    // 設定
    bool forward_checking_ = false;
    SelectionPolicy selection_policy_ = SelectionPolicy::Static;
    size_t node_limit_ = 0;

    // 状態
    size_t node_count_ = 0;
    SearchResult last_result_ = SearchResult::UNKNOWN;

    // 統計
    SolverStats stats_;
};

} // namespace tansaku_csp

#endif // TANSAKU_CSP_SOLVER_HPP
