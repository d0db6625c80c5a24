/**
 * CommTree Feature Model Implementation
 */

#include "commtree/feature.hpp"
#include "commtree/entropy.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>

namespace commtree {

namespace {

Float partition_entropy(const std::vector<Partition>& partitions) {
    std::vector<const EntityList*> subsets;
    subsets.reserve(partitions.size());
    for (const auto& p : partitions) {
        subsets.push_back(&p.entities);
    }
    return weighted_entropy(subsets);
}

// Entropy of a label histogram, ignoring labels with no entities left
Float histogram_entropy(const std::map<Label, Index>& counts) {
    std::vector<Index> values;
    values.reserve(counts.size());
    for (const auto& kv : counts) {
        if (kv.second > 0) values.push_back(kv.second);
    }
    return entropy(values);
}

} // namespace

std::vector<std::string> split_tokens(const std::string& value) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        size_t pos = value.find(',', start);
        if (pos == std::string::npos) {
            tokens.push_back(value.substr(start));
            break;
        }
        tokens.push_back(value.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

// ============================================================================
// DiscreteFeature
// ============================================================================

std::optional<std::string> DiscreteFeature::extract(const Entity& entity) const {
    const std::string* v = raw(entity);
    if (!v) return std::nullopt;
    return *v;
}

Split DiscreteFeature::split(const EntityList& entities) const {
    if (entities.size() < 2) invalid();

    Split result;
    std::map<BranchValue, size_t> group_of;

    for (const Entity* e : entities) {
        auto v = extract(*e);
        BranchValue key = v ? BranchValue(std::move(*v)) : BranchValue();

        auto it = group_of.find(key);
        if (it == group_of.end()) {
            it = group_of.emplace(key, result.partitions.size()).first;
            result.partitions.push_back(Partition{key, {}});
        }
        result.partitions[it->second].entities.push_back(e);
    }

    if (result.partitions.size() < 2) invalid();

    result.weighted_entropy = partition_entropy(result.partitions);
    return result;
}

BranchValue DiscreteFeature::identify(const SplitArg&, const Entity& entity) const {
    auto v = extract(entity);
    if (!v) return BranchValue();
    return BranchValue(std::move(*v));
}

std::optional<std::string> DiscreteIndexedFeature::extract(const Entity& entity) const {
    const std::string* v = raw(entity);
    if (!v) return std::nullopt;

    auto tokens = split_tokens(*v);
    if (tokens.size() <= index_) return std::nullopt;
    return std::move(tokens[index_]);
}

// ============================================================================
// MembershipFeature
// ============================================================================

std::vector<std::string> MembershipFeature::extract(const Entity& entity) const {
    const std::string* v = raw(entity);
    if (!v) return {};
    return split_tokens(*v);
}

Split MembershipFeature::split(const EntityList& entities) const {
    if (entities.size() < 2) invalid();

    const size_t n = entities.size();

    // Token -> indices of entities holding it, tokens in first-seen order
    std::vector<std::string> tokens;
    std::map<std::string, std::vector<size_t>> holders;

    for (size_t i = 0; i < n; ++i) {
        for (auto& token : extract(*entities[i])) {
            auto it = holders.find(token);
            if (it == holders.end()) {
                tokens.push_back(token);
                it = holders.emplace(std::move(token), std::vector<size_t>()).first;
            }
            if (it->second.empty() || it->second.back() != i) {
                it->second.push_back(i);
            }
        }
    }

    bool found = false;
    Split best;

    for (const auto& token : tokens) {
        const auto& idx = holders[token];
        if (idx.size() == n) continue;  // complement would be empty

        Partition yes{BranchValue(true), {}};
        Partition no{BranchValue(false), {}};
        yes.entities.reserve(idx.size());
        no.entities.reserve(n - idx.size());

        size_t k = 0;
        for (size_t i = 0; i < n; ++i) {
            if (k < idx.size() && idx[k] == i) {
                yes.entities.push_back(entities[i]);
                ++k;
            } else {
                no.entities.push_back(entities[i]);
            }
        }

        std::vector<Partition> partitions;
        partitions.push_back(std::move(yes));
        partitions.push_back(std::move(no));
        Float etp = partition_entropy(partitions);

        if (!found || etp < best.weighted_entropy) {
            found = true;
            best.weighted_entropy = etp;
            best.arg = token;
            best.partitions = std::move(partitions);
        }
    }

    if (!found) invalid();
    return best;
}

BranchValue MembershipFeature::identify(const SplitArg& arg, const Entity& entity) const {
    const std::string* token = std::get_if<std::string>(&arg);
    if (!token) return BranchValue(false);

    auto tokens = extract(entity);
    return BranchValue(std::find(tokens.begin(), tokens.end(), *token) != tokens.end());
}

std::vector<std::string> MembershipIndexedFeature::extract(const Entity& entity) const {
    auto tokens = MembershipFeature::extract(entity);
    if (tokens.size() > n_tokens_) {
        tokens.resize(n_tokens_);
    }
    return tokens;
}

// ============================================================================
// QuantitativeFeature
// ============================================================================

std::optional<Float> QuantitativeFeature::extract(const Entity& entity) const {
    const std::string* v = raw(entity);
    if (!v || v->empty()) return std::nullopt;

    const char* begin = v->c_str();
    char* end = nullptr;
    errno = 0;
    Float value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

Split QuantitativeFeature::split(const EntityList& entities) const {
    if (entities.size() < 2) invalid();

    std::vector<std::pair<Float, const Entity*>> pairs;
    EntityList undefined;
    pairs.reserve(entities.size());

    for (const Entity* e : entities) {
        auto v = extract(*e);
        if (v) {
            pairs.emplace_back(*v, e);
        } else {
            undefined.push_back(e);
        }
    }

    if (pairs.empty()) invalid();

    std::stable_sort(pairs.begin(), pairs.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    const size_t n = pairs.size();

    // Incremental label histograms on either side of the cut
    std::map<Label, Index> below, above;
    for (const auto& p : pairs) {
        above[p.second->label()] += 1;
    }

    size_t best_cut = 0;
    Float best_etp = 0.0;

    for (size_t i = 1; i < n; ++i) {
        const Label& moved = pairs[i - 1].second->label();
        below[moved] += 1;
        above[moved] -= 1;

        if (pairs[i].first == pairs[i - 1].first) continue;

        Float etp = (i * histogram_entropy(below) +
                     (n - i) * histogram_entropy(above)) / n;
        if (best_cut == 0 || etp < best_etp) {
            best_etp = etp;
            best_cut = i;
        }
    }

    // Undefined entities only join a split that has a cut among defined values
    if (best_cut == 0) invalid();

    Split result;
    result.arg = pairs[best_cut].first;

    Partition lt{BranchValue(std::string(kBelow)), {}};
    for (size_t i = 0; i < best_cut; ++i) {
        lt.entities.push_back(pairs[i].second);
    }
    result.partitions.push_back(std::move(lt));

    Partition ge{BranchValue(std::string(kAtOrAbove)), {}};
    for (size_t i = best_cut; i < n; ++i) {
        ge.entities.push_back(pairs[i].second);
    }
    result.partitions.push_back(std::move(ge));

    if (!undefined.empty()) {
        result.partitions.push_back(Partition{BranchValue(std::string(kUndefined)),
                                              std::move(undefined)});
    }

    result.weighted_entropy = partition_entropy(result.partitions);
    return result;
}

BranchValue QuantitativeFeature::identify(const SplitArg& arg, const Entity& entity) const {
    auto v = extract(entity);
    const Float* threshold = std::get_if<Float>(&arg);
    if (!v || !threshold) {
        return BranchValue(std::string(kUndefined));
    }
    return BranchValue(std::string(*v < *threshold ? kBelow : kAtOrAbove));
}

// ============================================================================
// FeatureRegistry
// ============================================================================

const Feature& FeatureRegistry::add(std::unique_ptr<Feature> feature) {
    if (!feature) {
        throw std::invalid_argument("Cannot register a null feature");
    }
    if (find(feature->name())) {
        throw std::invalid_argument("Duplicate feature: " + feature->name());
    }
    features_.push_back(std::move(feature));
    return *features_.back();
}

const Feature* FeatureRegistry::find(const std::string& name) const {
    for (const auto& f : features_) {
        if (f->name() == name) return f.get();
    }
    return nullptr;
}

const Feature& FeatureRegistry::get(const std::string& name) const {
    const Feature* f = find(name);
    if (!f) {
        throw UnknownFeature(name);
    }
    return *f;
}

FeatureRegistry FeatureRegistry::comment_categories() {
    FeatureRegistry registry;
    registry.emplace<DiscreteFeature>("type");
    registry.emplace<DiscreteIndexedFeature>("parentTypes");
    registry.emplace<MembershipIndexedFeature>("parentTypes");
    registry.emplace<MembershipFeature>("parentTypes");
    registry.emplace<DiscreteIndexedFeature>("leftTypes");
    registry.emplace<MembershipIndexedFeature>("leftTypes");
    registry.emplace<MembershipFeature>("leftTypes");
    registry.emplace<DiscreteFeature>("codeLike");
    registry.emplace<DiscreteFeature>("empty");
    registry.emplace<DiscreteIndexedFeature>("posTags");
    registry.emplace<MembershipIndexedFeature>("posTags");
    registry.emplace<MembershipFeature>("posTags");
    return registry;
}

FeatureRegistry FeatureRegistry::comment_targets() {
    FeatureRegistry registry;
    registry.emplace<QuantitativeFeature>("deltaLine");
    registry.emplace<QuantitativeFeature>("deltaCols");
    registry.emplace<QuantitativeFeature>("deltaLeft");
    registry.emplace<QuantitativeFeature>("deltaRight");
    registry.emplace<DiscreteIndexedFeature>("rightTypes");
    registry.emplace<MembershipIndexedFeature>("rightTypes");
    registry.emplace<MembershipFeature>("rightTypes");
    registry.emplace<MembershipIndexedFeature>("words");
    return registry;
}

FeatureRegistry FeatureRegistry::for_set(FeatureSet set) {
    switch (set) {
        case FeatureSet::Targets:
            return comment_targets();
        case FeatureSet::Categories:
        default:
            return comment_categories();
    }
}

} // namespace commtree
