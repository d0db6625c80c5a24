#pragma once

/**
 * CommTree Feature Model
 *
 * A feature extracts a value from an entity, proposes the partition of an
 * entity set that minimizes weighted entropy, and routes a single entity to
 * one of those partitions at classification time.
 *
 * Variants:
 * - DiscreteFeature          (DF:attr)   group by raw value
 * - DiscreteIndexedFeature   (DFi:attr)  group by the i-th comma token
 * - MembershipFeature        (MF:attr)   contains / lacks one token
 * - MembershipIndexedFeature (MFn:attr)  as above, first n tokens only
 * - QuantitativeFeature      (QF:attr)   below / at-or-above a threshold
 */

#include "types.hpp"
#include "config.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace commtree {

// ============================================================================
// Split Result
// ============================================================================

struct Partition {
    BranchValue value;
    EntityList entities;
};

struct Split {
    Float weighted_entropy = 0.0;
    SplitArg arg;
    std::vector<Partition> partitions;
};

// ============================================================================
// Feature Interface
// ============================================================================

class Feature {
public:
    Feature(std::string name, std::string attr)
        : name_(std::move(name)), attr_(std::move(attr)) {}
    virtual ~Feature() = default;

    Feature(const Feature&) = delete;
    Feature& operator=(const Feature&) = delete;

    const std::string& name() const { return name_; }
    const std::string& attribute() const { return attr_; }

    /**
     * Partition entities to minimize weighted entropy.
     * Throws InvalidSplit when fewer than two non-empty partitions can be
     * formed or when there are fewer than two entities.
     */
    virtual Split split(const EntityList& entities) const = 0;

    // Branch value of a single entity under a previously chosen split
    virtual BranchValue identify(const SplitArg& arg, const Entity& entity) const = 0;

    // Which SplitArg alternative this feature produces
    virtual SplitArgKind arg_kind() const = 0;

protected:
    const std::string* raw(const Entity& entity) const { return entity.get(attr_); }

    [[noreturn]] void invalid() const { throw InvalidSplit(name_); }

private:
    std::string name_;
    std::string attr_;
};

// Split a comma-delimited attribute value into tokens
std::vector<std::string> split_tokens(const std::string& value);

// ============================================================================
// Discrete Features
// ============================================================================

class DiscreteFeature : public Feature {
public:
    explicit DiscreteFeature(const std::string& attr)
        : Feature("DF:" + attr, attr) {}

    virtual std::optional<std::string> extract(const Entity& entity) const;

    Split split(const EntityList& entities) const override;
    BranchValue identify(const SplitArg& arg, const Entity& entity) const override;
    SplitArgKind arg_kind() const override { return SplitArgKind::None; }

protected:
    DiscreteFeature(std::string name, const std::string& attr)
        : Feature(std::move(name), attr) {}
};

class DiscreteIndexedFeature : public DiscreteFeature {
public:
    explicit DiscreteIndexedFeature(const std::string& attr, size_t index = 0)
        : DiscreteFeature("DF" + std::to_string(index) + ":" + attr, attr),
          index_(index) {}

    std::optional<std::string> extract(const Entity& entity) const override;

    size_t index() const { return index_; }

private:
    size_t index_;
};

// ============================================================================
// Membership Features
// ============================================================================

class MembershipFeature : public Feature {
public:
    explicit MembershipFeature(const std::string& attr)
        : Feature("MF:" + attr, attr) {}

    // Tokens of the attribute; empty when absent
    virtual std::vector<std::string> extract(const Entity& entity) const;

    Split split(const EntityList& entities) const override;
    BranchValue identify(const SplitArg& arg, const Entity& entity) const override;
    SplitArgKind arg_kind() const override { return SplitArgKind::Token; }

protected:
    MembershipFeature(std::string name, const std::string& attr)
        : Feature(std::move(name), attr) {}
};

class MembershipIndexedFeature : public MembershipFeature {
public:
    explicit MembershipIndexedFeature(const std::string& attr, size_t n_tokens = 1)
        : MembershipFeature("MF" + std::to_string(n_tokens) + ":" + attr, attr),
          n_tokens_(n_tokens) {}

    std::vector<std::string> extract(const Entity& entity) const override;

    size_t n_tokens() const { return n_tokens_; }

private:
    size_t n_tokens_;
};

// ============================================================================
// Quantitative Feature
// ============================================================================

class QuantitativeFeature : public Feature {
public:
    static constexpr const char* kBelow = "lt";
    static constexpr const char* kAtOrAbove = "ge";
    static constexpr const char* kUndefined = "un";

    explicit QuantitativeFeature(const std::string& attr)
        : Feature("QF:" + attr, attr) {}

    // Numeric value; undefined when absent, not a number or infinite
    std::optional<Float> extract(const Entity& entity) const;

    /**
     * Scans every cut between adjacent distinct values and keeps the one
     * with the lowest weighted entropy. Entities without a value go to a
     * separate "un" partition. Throws InvalidSplit when the defined values
     * offer no cut, even if some entities are undefined.
     */
    Split split(const EntityList& entities) const override;
    BranchValue identify(const SplitArg& arg, const Entity& entity) const override;
    SplitArgKind arg_kind() const override { return SplitArgKind::Threshold; }
};

// ============================================================================
// Feature Registry
// ============================================================================

/**
 * Ordered name -> feature mapping. Registration order is the candidate
 * order during building and decides ties between equally good splits.
 * Read-only once populated; passed explicitly to build and import.
 */
class FeatureRegistry {
public:
    FeatureRegistry() = default;

    FeatureRegistry(FeatureRegistry&&) = default;
    FeatureRegistry& operator=(FeatureRegistry&&) = default;

    FeatureRegistry(const FeatureRegistry&) = delete;
    FeatureRegistry& operator=(const FeatureRegistry&) = delete;

    // Throws std::invalid_argument on a duplicate name
    const Feature& add(std::unique_ptr<Feature> feature);

    template <typename F, typename... Args>
    const Feature& emplace(Args&&... args) {
        return add(std::make_unique<F>(std::forward<Args>(args)...));
    }

    const Feature* find(const std::string& name) const;

    // Throws UnknownFeature when absent
    const Feature& get(const std::string& name) const;

    size_t size() const { return features_.size(); }
    bool empty() const { return features_.empty(); }

    const std::vector<std::unique_ptr<Feature>>& features() const { return features_; }

    // ========================================================================
    // Presets
    // ========================================================================

    // Features for predicting a comment's category
    static FeatureRegistry comment_categories();

    // Features for predicting the code element a comment refers to
    static FeatureRegistry comment_targets();

    static FeatureRegistry for_set(FeatureSet set);

private:
    std::vector<std::unique_ptr<Feature>> features_;
};

} // namespace commtree
