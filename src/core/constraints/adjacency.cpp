#include "tansaku_csp/constraints/adjacency.hpp"
#include <algorithm>

namespace tansaku_csp {

AdjacencyConstraint::AdjacencyConstraint(std::vector<std::vector<size_t>> adjacency)
    : adjacency_(std::move(adjacency)) {
    for (auto& neighbors : adjacency_) {
        std::sort(neighbors.begin(), neighbors.end());
        neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
    }
}

std::string AdjacencyConstraint::name() const {
    return "adjacency";
}

size_t AdjacencyConstraint::num_edges() const {
    size_t count = 0;
    for (size_t a = 0; a < adjacency_.size(); ++a) {
        for (size_t b : adjacency_[a]) {
            if (a < b) ++count;
        }
    }
    return count;
}

} // namespace tansaku_csp
