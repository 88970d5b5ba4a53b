#include "tansaku_csp/problems/map_coloring.hpp"
#include "tansaku_csp/constraints/adjacency.hpp"
#include <algorithm>
#include <stdexcept>

namespace tansaku_csp {

std::vector<std::string> default_palette() {
    return {"#e31a93", "#ffff00", "#1f78b4", "#33a02c", "#e31a1c", "#ff7f00"};
}

Adjacency normalize_adjacency(const Adjacency& adjacency) {
    Adjacency result;
    for (const auto& [region, neighbors] : adjacency) {
        result[region];
        for (const auto& neighbor : neighbors) {
            if (neighbor == region) {
                throw std::runtime_error("Region " + region + " is adjacent to itself");
            }
            if (!adjacency.count(neighbor)) {
                throw std::runtime_error("Region " + region + " refers to unknown region " + neighbor);
            }
            result[region].push_back(neighbor);
            result[neighbor].push_back(region);
        }
    }
    for (auto& [region, neighbors] : result) {
        std::sort(neighbors.begin(), neighbors.end());
        neighbors.erase(std::unique(neighbors.begin(), neighbors.end()), neighbors.end());
    }
    return result;
}

MapColoring::MapColoring(const Adjacency& adjacency, std::vector<std::string> palette)
    : adjacency_(normalize_adjacency(adjacency))
    , palette_(std::move(palette)) {
    if (palette_.empty()) {
        throw std::runtime_error("Palette must contain at least one color");
    }
    std::sort(palette_.begin(), palette_.end());
    palette_.erase(std::unique(palette_.begin(), palette_.end()), palette_.end());

    regions_.reserve(adjacency_.size());
    for (const auto& entry : adjacency_) {
        regions_.push_back(entry.first);
    }
}

std::unique_ptr<Model> MapColoring::to_model() const {
    auto model = std::make_unique<Model>();
    auto max_value = static_cast<Domain::value_type>(palette_.size()) - 1;
    for (const auto& region : regions_) {
        model->create_variable(region, 0, max_value);
    }

    std::vector<std::vector<size_t>> graph(regions_.size());
    for (size_t i = 0; i < regions_.size(); ++i) {
        for (const auto& neighbor : adjacency_.at(regions_[i])) {
            graph[i].push_back(model->find_variable_index(neighbor));
        }
    }
    model->add_constraint(std::make_shared<AdjacencyConstraint>(std::move(graph)));
    model->set_value_labels(palette_);
    return model;
}

Coloring MapColoring::to_coloring(const Assignment& assignment) const {
    Coloring coloring;
    for (size_t i = 0; i < regions_.size(); ++i) {
        const auto& v = assignment.value(i);
        if (v) {
            coloring[regions_[i]] = palette_[static_cast<size_t>(*v)];
        }
    }
    return coloring;
}

std::optional<Coloring> MapColoring::solve(Solver& solver) const {
    auto model = to_model();
    auto result = solver.solve(*model);
    if (!result) {
        return std::nullopt;
    }
    return to_coloring(*result);
}

bool MapColoring::is_solution(const Coloring& coloring) const {
    if (coloring.size() != regions_.size()) {
        return false;
    }
    for (const auto& [region, neighbors] : adjacency_) {
        auto it = coloring.find(region);
        if (it == coloring.end() ||
            !std::binary_search(palette_.begin(), palette_.end(), it->second)) {
            return false;
        }
        for (const auto& neighbor : neighbors) {
            auto nit = coloring.find(neighbor);
            if (nit != coloring.end() && nit->second == it->second) {
                return false;
            }
        }
    }
    return true;
}

} // namespace tansaku_csp
