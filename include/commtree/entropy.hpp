#pragma once

/**
 * CommTree Entropy Metrics
 *
 * Shannon entropy of label distributions and majority-label selection.
 * All functions are pure.
 */

#include "types.hpp"
#include <utility>
#include <vector>

namespace commtree {

// ============================================================================
// Label Counts
// ============================================================================

/**
 * Label histogram kept in order of first occurrence.
 * Iteration order decides majority-label ties.
 */
class LabelCounts {
public:
    using Entry = std::pair<Label, Index>;

    LabelCounts() = default;

    void add(const Label& label, Index count = 1);

    Index count(const Label& label) const;
    Index total() const { return total_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<Index> values() const;

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    Index total_ = 0;
};

// ============================================================================
// Entropy Functions
// ============================================================================

/**
 * Entropy of a count distribution: sum(c * log2(n / c)) / n.
 * Throws std::invalid_argument on an empty collection or a zero count.
 */
Float entropy(const std::vector<Index>& counts);

// Label histogram of a non-empty entity set
LabelCounts label_counts(const EntityList& entities);

Float dataset_entropy(const EntityList& entities);

/**
 * Label with the highest count. Ties go to the label seen first.
 * Throws std::invalid_argument when counts is empty.
 */
const Label& majority_label(const LabelCounts& counts);

/**
 * Size-weighted mean entropy over the subsets of a partition.
 * Empty subsets contribute nothing.
 */
Float weighted_entropy(const std::vector<const EntityList*>& subsets);

} // namespace commtree
