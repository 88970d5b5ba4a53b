#include "tansaku_csp/solver.hpp"
#include "tansaku_csp/propagator.hpp"
#include <chrono>
#include <iostream>

namespace tansaku_csp {

namespace {
std::string format_domain(const Model& model, const std::vector<Domain::value_type>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += model.format_value(values[i]);
    }
    out += "]";
    return out;
}
}  // namespace

std::optional<Assignment> Solver::solve(Model& model) {
    auto start = std::chrono::steady_clock::now();

    // 初期化
    stats_ = SolverStats{};
    node_count_ = 0;

    if (verbose_) {
        std::cerr << "% [verbose] solve start: " << model.num_variables() << " variables, "
                  << model.assignment().assigned_count() << " fixed, "
                  << (forward_checking_ ? "forward checking" : "plain backtracking") << ", "
                  << (selection_policy_ == SelectionPolicy::MRV ? "MRV" : "static order") << "\n";
    }

    PruningRecord root_record;
    SearchResult res = SearchResult::UNSAT;
    if (presolve(model, root_record)) {
        res = run_search(model, 0);
    } else if (verbose_) {
        std::cerr << "% [verbose] presolve failed\n";
    }

    // 解が見つからなければ presolve の除去も取り消す
    if (res != SearchResult::SAT) {
        model.domains().undo(root_record);
    }

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    stats_.elapsed_seconds = elapsed.count();
    last_result_ = res;

    if (res == SearchResult::SAT) {
        return model.assignment();
    }
    return std::nullopt;
}

bool Solver::presolve(Model& model, PruningRecord& root_record) {
    const auto& assignment = model.assignment();

    // 固定済み変数どうしの矛盾（例: 同じ行に同じ数字）
    for (size_t i = 0; i < model.num_variables(); ++i) {
        const auto& value = assignment.value(i);
        if (!value) {
            continue;
        }
        if (!model.domains().domain(i).contains(*value) || !model.is_consistent(i, *value)) {
            if (verbose_) {
                std::cerr << "% [verbose] fixed variable " << model.variable_name(i) << " = "
                          << model.format_value(*value) << " is inconsistent\n";
            }
            return false;
        }
    }

    // 固定済みの値を peer の定義域から除去（前方検査の有無によらない）
    for (size_t i = 0; i < model.num_variables(); ++i) {
        const auto& value = assignment.value(i);
        if (!value) {
            continue;
        }
        for (const auto& constraint : model.constraints()) {
            if (!forward_check(*constraint, i, *value, model.domains(), assignment, root_record)) {
                return false;
            }
        }
    }
    return true;
}

SearchResult Solver::run_search(Model& model, size_t depth) {
    // タイムアウトチェック
    if (stopped_) {
        return SearchResult::UNKNOWN;
    }

    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    auto& assignment = model.assignment();
    auto& domains = model.domains();

    if (assignment.is_complete()) {
        return SearchResult::SAT;
    }

    // 変数選択
    size_t var_idx = select_variable(selection_policy_, assignment, domains);
    if (var_idx == SIZE_MAX) {
        return SearchResult::SAT;
    }

    if (domains.size(var_idx) == 0) {
        if (verbose_) {
            std::cerr << "% [verbose] " << model.variable_name(var_idx) << ": empty domain\n";
        }
        return SearchResult::UNSAT;
    }

    // 値は昇順に試す（探索中に定義域が変わるのでコピーを走査）
    auto values = domains.domain(var_idx).values();

    if (verbose_) {
        std::cerr << "% [verbose] select " << model.variable_name(var_idx)
                  << " depth=" << depth << " domain=" << format_domain(model, values) << "\n";
    }

    for (auto val : values) {
        if (!model.is_consistent(var_idx, val)) {
            if (verbose_) {
                std::cerr << "% [verbose]   " << model.format_value(val) << " not allowed for "
                          << model.variable_name(var_idx) << " (conflict)\n";
            }
            continue;
        }

        if (node_limit_ > 0 && node_count_ >= node_limit_) {
            if (verbose_) std::cerr << "% [verbose] node limit reached\n";
            return SearchResult::UNKNOWN;
        }
        ++node_count_;

        assignment.assign(var_idx, val);
        stats_.assignments++;
        if (verbose_) {
            std::cerr << "% [verbose]   ASSIGN " << model.variable_name(var_idx) << " = "
                      << model.format_value(val) << "\n";
        }

        PruningRecord record;
        bool propagate_ok = true;
        if (forward_checking_) {
            propagate_ok = propagate_assignment(model, var_idx, val, record);
        }

        if (propagate_ok) {
            auto res = run_search(model, depth + 1);
            if (res == SearchResult::SAT) {
                return res;
            }
            if (res == SearchResult::UNKNOWN) {
                backtrack(model, var_idx, record);
                return res;
            }
        } else if (verbose_) {
            std::cerr << "% [verbose]   wipeout after " << model.variable_name(var_idx) << " = "
                      << model.format_value(val) << " (" << record.size() << " prunings)\n";
        }

        // 伝播失敗時も部分的な除去が record に残っているので同じ経路で戻す
        backtrack(model, var_idx, record);
        stats_.backtracks++;
    }

    return SearchResult::UNSAT;
}

bool Solver::propagate_assignment(Model& model, size_t var_idx, Domain::value_type value,
                                  PruningRecord& record) {
    auto& domains = model.domains();
    domains.collapse(var_idx, value, record);

    for (const auto& constraint : model.constraints()) {
        if (!forward_check(*constraint, var_idx, value, domains, model.assignment(), record)) {
            return false;
        }
    }
    return true;
}

void Solver::backtrack(Model& model, size_t var_idx, const PruningRecord& record) {
    model.domains().undo(record);
    model.assignment().unassign(var_idx);
    if (verbose_) {
        std::cerr << "% [verbose]   UNASSIGN " << model.variable_name(var_idx) << " (backtracking)\n";
    }
}

} // namespace tansaku_csp
