#include "tansaku_csp/domain_store.hpp"

namespace tansaku_csp {

bool DomainStore::collapse(size_t var_idx, Domain::value_type value, PruningRecord& record) {
    auto& d = domains_[var_idx];
    if (!d.contains(value)) {
        return false;
    }
    for (auto v : d.values()) {
        if (v != value && d.remove(v)) {
            record.push(var_idx, v);
        }
    }
    return true;
}

bool DomainStore::prune(size_t var_idx, Domain::value_type value, PruningRecord& record) {
    if (!domains_[var_idx].remove(value)) {
        return false;
    }
    record.push(var_idx, value);
    return true;
}

void DomainStore::undo(const PruningRecord& record) {
    for (auto it = record.rbegin(); it != record.rend(); ++it) {
        domains_[it->var_idx].restore(it->value);
    }
}

} // namespace tansaku_csp
