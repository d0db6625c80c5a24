#pragma once

/**
 * CommTree: Evaluation
 *
 * Classification against an induced tree and per-label scoring:
 * - Precision, Recall, F1 per label
 * - Overall accuracy
 * - Label x label confusion matrix
 *
 * Undefined ratios are reported as NaN: precision when a label is never
 * predicted, recall when it never occurs, F1 when either is undefined.
 */

#include "types.hpp"
#include "tree.hpp"
#include <Eigen/Core>
#include <limits>
#include <string>
#include <vector>

namespace commtree {

// ============================================================================
// Score Report
// ============================================================================

struct LabelScore {
    Label label;
    Index correct = 0;     // Predicted and actual
    Index predicted = 0;   // Predicted as this label
    Index actual = 0;      // Actually this label

    Float precision() const {
        return predicted > 0 ? static_cast<Float>(correct) / predicted
                             : std::numeric_limits<Float>::quiet_NaN();
    }

    Float recall() const {
        return actual > 0 ? static_cast<Float>(correct) / actual
                          : std::numeric_limits<Float>::quiet_NaN();
    }

    Float f1_score() const;
};

using ConfusionMatrix = Eigen::Matrix<Index, Eigen::Dynamic, Eigen::Dynamic>;

struct ScoreReport {
    std::vector<LabelScore> labels;   // Actual labels first, then predicted-only ones
    ConfusionMatrix confusion;        // Rows actual, columns predicted, in labels order
    Index correct = 0;
    Index total = 0;

    Float accuracy() const {
        return total > 0 ? static_cast<Float>(correct) / total
                         : std::numeric_limits<Float>::quiet_NaN();
    }

    // nullptr if the label never occurred nor was predicted
    const LabelScore* find(const Label& label) const;
};

// ============================================================================
// Evaluator
// ============================================================================

class Evaluator {
public:
    /**
     * Route entity down the tree. A branch value without a child yields the
     * branch's default label. Never throws.
     */
    static const Label& classify(const TreeNode& node, const Entity& entity);

    /**
     * Classify every entity and tally per-label statistics.
     * Throws std::invalid_argument on an empty entity set.
     */
    static ScoreReport score_all(const TreeNode& tree, const EntityList& entities);
    static ScoreReport score_all(const Tree& tree, const EntityList& entities);

    /**
     * One line per label:
     *   "<label>: prec=P(c/p), recl=R(c/a), F=F"
     * followed by "<correct>/<total>".
     */
    static std::string format_report(const ScoreReport& report);
};

} // namespace commtree
