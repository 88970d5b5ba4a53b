#include "tansaku_csp/domain.hpp"
#include <algorithm>
#include <cassert>

namespace tansaku_csp {

Domain::Domain()
    : offset_(0)
    , n_(0) {}

Domain::Domain(value_type min, value_type max)
    : offset_(min)
    , n_(0) {
    if (min > max) {
        offset_ = 0;
        return;
    }
    size_t range = static_cast<size_t>(max - min + 1);
    sparse_.assign(range, SIZE_MAX);
    values_.reserve(range);
    for (value_type v = min; v <= max; ++v) {
        sparse_[static_cast<size_t>(v - offset_)] = values_.size();
        values_.push_back(v);
    }
    n_ = values_.size();
}

Domain::Domain(std::vector<value_type> values)
    : offset_(0)
    , n_(0) {
    if (values.empty()) {
        return;
    }
    // 重複を除去してソート
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());

    values_ = std::move(values);
    n_ = values_.size();
    offset_ = values_.front();

    size_t range = static_cast<size_t>(values_.back() - offset_ + 1);
    sparse_.assign(range, SIZE_MAX);
    for (size_t i = 0; i < n_; ++i) {
        sparse_[static_cast<size_t>(values_[i] - offset_)] = i;
    }
}

size_t Domain::index_of(value_type value) const {
    if (value < offset_) {
        return SIZE_MAX;
    }
    auto idx_val = static_cast<size_t>(value - offset_);
    if (idx_val >= sparse_.size()) {
        return SIZE_MAX;
    }
    return sparse_[idx_val];
}

bool Domain::contains(value_type value) const {
    return index_of(value) < n_;
}

bool Domain::remove(value_type value) {
    size_t idx = index_of(value);
    if (idx >= n_) {
        return false;  // 元々存在しない
    }
    swap_at(idx, n_ - 1);
    --n_;
    return true;
}

bool Domain::restore(value_type value) {
    size_t idx = index_of(value);
    if (idx == SIZE_MAX || idx < n_) {
        return false;  // 初期値でない or 既に有効
    }
    // 直前に削除された値なら idx == n_ で swap は no-op
    swap_at(idx, n_);
    ++n_;
    return true;
}

std::vector<Domain::value_type> Domain::values() const {
    std::vector<value_type> result(values_.begin(), values_.begin() + static_cast<std::ptrdiff_t>(n_));
    std::sort(result.begin(), result.end());
    return result;
}

bool Domain::operator==(const Domain& other) const {
    return n_ == other.n_ && values() == other.values();
}

void Domain::swap_at(size_t i, size_t j) {
    assert(i < values_.size() && "swap_at: index i out of bounds");
    assert(j < values_.size() && "swap_at: index j out of bounds");
    if (i == j) return;
    value_type vi = values_[i];
    value_type vj = values_[j];
    values_[i] = vj;
    values_[j] = vi;
    sparse_[static_cast<size_t>(vi - offset_)] = j;
    sparse_[static_cast<size_t>(vj - offset_)] = i;
}

} // namespace tansaku_csp
