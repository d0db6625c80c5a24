/**
 * CommTree Evaluation Implementation
 */

#include "commtree/metrics.hpp"
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace commtree {

// ============================================================================
// Scores
// ============================================================================

Float LabelScore::f1_score() const {
    Float p = precision();
    Float r = recall();
    if (std::isnan(p) || std::isnan(r)) {
        return std::numeric_limits<Float>::quiet_NaN();
    }
    return (p + r > 0) ? 2.0 * p * r / (p + r) : 0.0;
}

const LabelScore* ScoreReport::find(const Label& label) const {
    for (const auto& s : labels) {
        if (s.label == label) return &s;
    }
    return nullptr;
}

// ============================================================================
// Evaluator
// ============================================================================

const Label& Evaluator::classify(const TreeNode& node, const Entity& entity) {
    const TreeNode* current = &node;
    while (!current->is_leaf) {
        BranchValue value = current->feature->identify(current->arg, entity);
        const TreeNode* next = current->child(value);
        if (!next) {
            return current->default_label();
        }
        current = next;
    }
    return current->label;
}

ScoreReport Evaluator::score_all(const TreeNode& tree, const EntityList& entities) {
    if (entities.empty()) {
        throw std::invalid_argument("Cannot score an empty entity set");
    }

    ScoreReport report;

    auto slot = [&report](const Label& label) -> size_t {
        for (size_t i = 0; i < report.labels.size(); ++i) {
            if (report.labels[i].label == label) return i;
        }
        report.labels.push_back(LabelScore{label});
        return report.labels.size() - 1;
    };

    // Register actual labels first so they lead the report
    for (const Entity* e : entities) {
        slot(e->label());
    }

    std::vector<std::pair<size_t, size_t>> outcomes;
    outcomes.reserve(entities.size());

    for (const Entity* e : entities) {
        const Label& predicted = classify(tree, *e);
        size_t a = slot(e->label());
        size_t p = slot(predicted);

        report.labels[a].actual += 1;
        report.labels[p].predicted += 1;
        if (a == p) {
            report.labels[a].correct += 1;
            report.correct += 1;
        }
        outcomes.emplace_back(a, p);
    }
    report.total = static_cast<Index>(entities.size());

    const Eigen::Index k = static_cast<Eigen::Index>(report.labels.size());
    report.confusion = ConfusionMatrix::Zero(k, k);
    for (const auto& o : outcomes) {
        report.confusion(static_cast<Eigen::Index>(o.first),
                         static_cast<Eigen::Index>(o.second)) += 1;
    }

    return report;
}

ScoreReport Evaluator::score_all(const Tree& tree, const EntityList& entities) {
    return score_all(tree.root(), entities);
}

std::string Evaluator::format_report(const ScoreReport& report) {
    std::string out;
    char buf[256];

    for (const auto& s : report.labels) {
        std::snprintf(buf, sizeof(buf),
                      ": prec=%.3f(%u/%u), recl=%.3f(%u/%u), F=%.3f\n",
                      s.precision(), s.correct, s.predicted,
                      s.recall(), s.correct, s.actual,
                      s.f1_score());
        out += s.label;
        out += buf;
    }

    std::snprintf(buf, sizeof(buf), "%u/%u\n", report.correct, report.total);
    out += buf;
    return out;
}

} // namespace commtree
