/**
 * @file domain_store.hpp
 * @brief 全変数の定義域と、その変更履歴（PruningRecord）
 */
#ifndef TANSAKU_CSP_DOMAIN_STORE_HPP
#define TANSAKU_CSP_DOMAIN_STORE_HPP

#include "tansaku_csp/domain.hpp"
#include <vector>
#include <cstddef>
#include <utility>

namespace tansaku_csp {

/**
 * @brief 定義域から除去された (変数, 値) の組
 */
struct Pruning {
    size_t var_idx;
    Domain::value_type value;

    bool operator==(const Pruning& other) const {
        return var_idx == other.var_idx && value == other.value;
    }
};

/**
 * @brief 1回の試行で行った定義域の除去記録
 *
 * 記録を作った探索フレームが所有し、そのフレームの undo で
 * 逆順に一度だけ再生される。
 */
class PruningRecord {
public:
    using const_iterator = std::vector<Pruning>::const_iterator;
    using const_reverse_iterator = std::vector<Pruning>::const_reverse_iterator;

    void push(size_t var_idx, Domain::value_type value) { entries_.push_back({var_idx, value}); }

    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }
    const Pruning& operator[](size_t i) const { return entries_[i]; }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    const_reverse_iterator rbegin() const { return entries_.rbegin(); }
    const_reverse_iterator rend() const { return entries_.rend(); }

private:
    std::vector<Pruning> entries_;
};

/**
 * @brief 変数インデックス -> 定義域
 *
 * 変更はすべて PruningRecord 経由で行い、undo() で正確に元に戻す。
 */
class DomainStore {
public:
    DomainStore() = default;

    /**
     * @brief 変数の定義域を追加
     * @return 変数インデックス
     */
    size_t add(Domain domain) {
        domains_.push_back(std::move(domain));
        return domains_.size() - 1;
    }

    size_t num_variables() const { return domains_.size(); }

    const Domain& domain(size_t var_idx) const { return domains_[var_idx]; }
    size_t size(size_t var_idx) const { return domains_[var_idx].size(); }

    /**
     * @brief 定義域を {value} に縮める
     *
     * value 以外の値をすべて除去し record に追記する。
     * @return value が定義域に含まれていればtrue（含まれていなければ何もしない）
     */
    bool collapse(size_t var_idx, Domain::value_type value, PruningRecord& record);

    /**
     * @brief 値を1つ除去
     * @return 除去が発生したらtrue（record に追記される）
     */
    bool prune(size_t var_idx, Domain::value_type value, PruningRecord& record);

    /**
     * @brief record を逆順に再生して除去を取り消す
     *
     * 既に含まれている値は再挿入しない。record 自体は変更しない。
     */
    void undo(const PruningRecord& record);

    bool operator==(const DomainStore& other) const { return domains_ == other.domains_; }
    bool operator!=(const DomainStore& other) const { return !(*this == other); }

private:
    std::vector<Domain> domains_;
};

} // namespace tansaku_csp

#endif // TANSAKU_CSP_DOMAIN_STORE_HPP
