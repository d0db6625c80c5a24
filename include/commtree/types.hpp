#pragma once

/**
 * CommTree: Entropy-Driven Decision Trees for Comment Classification
 *
 * Core type definitions:
 * - Entities (attribute records with a classification label)
 * - Branch values and split arguments carried by tree nodes
 * - Exception types shared by the feature model, builder and codec
 */

#include <cstdint>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace commtree {

// ============================================================================
// Basic Types
// ============================================================================

using Float = double;                   // Entropies, thresholds, scores
using Index = uint32_t;                 // Entity counts
using Label = std::string;              // Classification labels

// ============================================================================
// Entity
// ============================================================================

/**
 * One labelled record. Attribute values are raw strings; a multi-valued
 * attribute is a comma-delimited string. Absent attributes are undefined.
 */
class Entity {
public:
    Entity() = default;
    explicit Entity(Label label) : label_(std::move(label)) {}

    // Returns nullptr when the attribute is absent
    const std::string* get(const std::string& attr) const {
        auto it = attrs_.find(attr);
        return it == attrs_.end() ? nullptr : &it->second;
    }

    bool has(const std::string& attr) const { return attrs_.count(attr) > 0; }

    void set(const std::string& attr, std::string value) {
        attrs_[attr] = std::move(value);
    }

    void erase(const std::string& attr) { attrs_.erase(attr); }

    const Label& label() const { return label_; }
    void set_label(Label label) { label_ = std::move(label); }

    const std::map<std::string, std::string>& attributes() const { return attrs_; }

private:
    std::map<std::string, std::string> attrs_;
    Label label_;
};

// Non-owning view over caller-owned entities
using EntityList = std::vector<const Entity*>;

inline EntityList make_entity_list(const std::vector<Entity>& entities) {
    EntityList list;
    list.reserve(entities.size());
    for (const auto& e : entities) {
        list.push_back(&e);
    }
    return list;
}

// ============================================================================
// Branch Values and Split Arguments
// ============================================================================

/**
 * Key of a child under a branch:
 * - std::monostate  undefined discrete value
 * - bool            membership test outcome
 * - std::string     discrete value, or "lt"/"ge"/"un" for quantitative splits
 */
using BranchValue = std::variant<std::monostate, bool, std::string>;

/**
 * Parameter chosen by a split:
 * - std::monostate  discrete features
 * - std::string     membership token
 * - Float           quantitative threshold
 */
using SplitArg = std::variant<std::monostate, std::string, Float>;

enum class SplitArgKind : uint8_t {
    None = 0,
    Token = 1,
    Threshold = 2
};

std::string to_string(const BranchValue& value);
std::string to_string(const SplitArg& arg);

// ============================================================================
// Exceptions
// ============================================================================

/**
 * A feature cannot form two non-empty partitions on the given subset.
 * Expected during tree building; the feature is skipped at that node.
 */
class InvalidSplit : public std::runtime_error {
public:
    explicit InvalidSplit(const std::string& feature)
        : std::runtime_error("No valid split for feature " + feature) {}
};

// Feature name not present in the registry
class UnknownFeature : public std::runtime_error {
public:
    explicit UnknownFeature(const std::string& name)
        : std::runtime_error("Unknown feature: " + name), name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Persisted tree does not match the Branch/Leaf grammar
class TreeParseError : public std::runtime_error {
public:
    explicit TreeParseError(const std::string& what)
        : std::runtime_error("Malformed tree: " + what) {}
};

} // namespace commtree
