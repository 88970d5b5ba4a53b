/**
 * @file map_coloring.hpp
 * @brief 地図彩色問題（隣接リスト + パレット）と CSP モデルの相互変換
 */
#ifndef TANSAKU_CSP_PROBLEMS_MAP_COLORING_HPP
#define TANSAKU_CSP_PROBLEMS_MAP_COLORING_HPP

#include "tansaku_csp/model.hpp"
#include "tansaku_csp/solver.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tansaku_csp {

/**
 * @brief 領域名 -> 隣接する領域名のリスト
 */
using Adjacency = std::map<std::string, std::vector<std::string>>;

/**
 * @brief 領域名 -> 色
 */
using Coloring = std::map<std::string, std::string>;

/**
 * @brief デフォルトのパレット（6色）
 */
std::vector<std::string> default_palette();

/**
 * @brief 隣接リストを正規化
 *
 * 各リストを重複なし・昇順にし、A -> B があれば B -> A も追加する。
 *
 * @throws std::runtime_error 未知の領域を参照している場合、自己ループがある場合
 */
Adjacency normalize_adjacency(const Adjacency& adjacency);

/**
 * @brief 地図彩色問題
 *
 * 変数は領域名の昇順、値はパレットを辞書順に並べたときのインデックス。
 * したがって値の昇順 = 色名の辞書順で試行される。
 */
class MapColoring {
public:
    /**
     * @throws std::runtime_error 隣接リストが不正な場合、パレットが空の場合
     */
    explicit MapColoring(const Adjacency& adjacency,
                         std::vector<std::string> palette = default_palette());

    /**
     * @brief 正規化済みの隣接リスト
     */
    const Adjacency& adjacency() const { return adjacency_; }

    /**
     * @brief 領域名（昇順）
     */
    const std::vector<std::string>& regions() const { return regions_; }

    /**
     * @brief パレット（辞書順、重複なし）
     */
    const std::vector<std::string>& palette() const { return palette_; }

    /**
     * @brief CSP モデルを構築
     */
    std::unique_ptr<Model> to_model() const;

    /**
     * @brief 割り当てを彩色に変換（未割り当ての領域は含まない）
     */
    Coloring to_coloring(const Assignment& assignment) const;

    /**
     * @brief 解く
     * @return 彩色、解がなければstd::nullopt
     */
    std::optional<Coloring> solve(Solver& solver) const;

    /**
     * @brief coloring が正しい彩色か
     *
     * 全領域にパレット内の色が1つずつ割り当てられ、隣接する領域の色が異なること。
     */
    bool is_solution(const Coloring& coloring) const;

private:
    Adjacency adjacency_;
    std::vector<std::string> regions_;
    std::vector<std::string> palette_;
};

} // namespace tansaku_csp

#endif // TANSAKU_CSP_PROBLEMS_MAP_COLORING_HPP
