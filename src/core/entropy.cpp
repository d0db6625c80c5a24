/**
 * CommTree Entropy Metrics Implementation
 */

#include "commtree/entropy.hpp"
#include <cmath>
#include <stdexcept>

namespace commtree {

// ============================================================================
// LabelCounts
// ============================================================================

void LabelCounts::add(const Label& label, Index count) {
    total_ += count;
    for (auto& entry : entries_) {
        if (entry.first == label) {
            entry.second += count;
            return;
        }
    }
    entries_.emplace_back(label, count);
}

Index LabelCounts::count(const Label& label) const {
    for (const auto& entry : entries_) {
        if (entry.first == label) return entry.second;
    }
    return 0;
}

std::vector<Index> LabelCounts::values() const {
    std::vector<Index> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.second);
    }
    return result;
}

// ============================================================================
// Entropy Functions
// ============================================================================

Float entropy(const std::vector<Index>& counts) {
    if (counts.empty()) {
        throw std::invalid_argument("entropy of an empty distribution");
    }

    Float n = 0.0;
    for (Index c : counts) {
        if (c == 0) {
            throw std::invalid_argument("entropy counts must be positive");
        }
        n += c;
    }

    Float sum = 0.0;
    for (Index c : counts) {
        sum += c * std::log2(n / c);
    }
    return sum / n;
}

LabelCounts label_counts(const EntityList& entities) {
    if (entities.empty()) {
        throw std::invalid_argument("label counts of an empty entity set");
    }
    LabelCounts counts;
    for (const Entity* e : entities) {
        counts.add(e->label());
    }
    return counts;
}

Float dataset_entropy(const EntityList& entities) {
    return entropy(label_counts(entities).values());
}

const Label& majority_label(const LabelCounts& counts) {
    if (counts.empty()) {
        throw std::invalid_argument("majority label of an empty distribution");
    }

    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        // Strict comparison keeps the earliest label on ties
        if (best->second < it->second) {
            best = it;
        }
    }
    return best->first;
}

Float weighted_entropy(const std::vector<const EntityList*>& subsets) {
    Float total = 0.0;
    Float sum = 0.0;
    for (const EntityList* subset : subsets) {
        if (subset->empty()) continue;
        sum += subset->size() * dataset_entropy(*subset);
        total += subset->size();
    }
    return total > 0 ? sum / total : 0.0;
}

} // namespace commtree
