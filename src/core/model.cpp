#include "tansaku_csp/model.hpp"
#include <stdexcept>

namespace tansaku_csp {

size_t Model::create_variable(std::string name, Domain domain) {
    if (name_to_id_.count(name)) {
        throw std::runtime_error("Duplicate variable: " + name);
    }
    size_t id = names_.size();
    name_to_id_[name] = id;
    names_.push_back(std::move(name));
    domains_.add(std::move(domain));
    assignment_.add_variable();
    return id;
}

size_t Model::create_variable(std::string name, Domain::value_type min, Domain::value_type max) {
    return create_variable(std::move(name), Domain(min, max));
}

size_t Model::create_variable(std::string name, Domain::value_type value) {
    size_t id = create_variable(std::move(name), Domain(value, value));
    assignment_.assign(id, value);
    return id;
}

void Model::add_constraint(ConstraintPtr constraint) {
    if (constraint->num_variables() != names_.size()) {
        throw std::runtime_error("Constraint " + constraint->name() + " expects " +
                                 std::to_string(constraint->num_variables()) +
                                 " variables, model has " + std::to_string(names_.size()));
    }
    constraints_.push_back(std::move(constraint));
}

const std::string& Model::variable_name(size_t var_idx) const {
    if (var_idx >= names_.size()) {
        throw std::out_of_range("Variable ID out of range");
    }
    return names_[var_idx];
}

size_t Model::find_variable_index(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it != name_to_id_.end()) return it->second;
    return SIZE_MAX;
}

std::string Model::format_value(Domain::value_type value) const {
    if (value >= 0 && static_cast<size_t>(value) < value_labels_.size()) {
        return value_labels_[static_cast<size_t>(value)];
    }
    return std::to_string(value);
}

bool Model::is_consistent(size_t var_idx, Domain::value_type value) const {
    for (const auto& constraint : constraints_) {
        if (!constraint->is_consistent(assignment_, var_idx, value)) {
            return false;
        }
    }
    return true;
}

bool Model::is_solution() const {
    if (!assignment_.is_complete()) {
        return false;
    }
    for (const auto& constraint : constraints_) {
        auto satisfied = constraint->is_satisfied(assignment_);
        if (!satisfied.value_or(false)) {
            return false;
        }
    }
    return true;
}

} // namespace tansaku_csp
