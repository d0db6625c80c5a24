#pragma once

/**
 * CommTree Tree Structures
 *
 * Includes:
 * - TreeNode: Branch/Leaf node of an induced tree
 * - Tree: owner of a root node with summary statistics
 * - TreeBuilder: greedy entropy-minimizing induction
 *
 * Branches refer to features owned by a FeatureRegistry; the registry must
 * outlive every tree built or imported against it.
 */

#include "types.hpp"
#include "config.hpp"
#include "entropy.hpp"
#include "feature.hpp"
#include <iosfwd>
#include <memory>
#include <vector>

namespace commtree {

// ============================================================================
// Tree Node
// ============================================================================

struct TreeNode;

struct TreeChild {
    BranchValue value;
    std::unique_ptr<TreeNode> node;
};

struct TreeNode {
    bool is_leaf = true;

    // Leaf: predicted label. Branch: default for branch values without a child.
    Label label;

    // Branch only
    const Feature* feature = nullptr;
    SplitArg arg;
    std::vector<TreeChild> children;

    static std::unique_ptr<TreeNode> make_leaf(Label label);
    static std::unique_ptr<TreeNode> make_branch(
        const Feature& feature,
        SplitArg arg,
        Label default_label,
        std::vector<TreeChild> children
    );

    const Label& default_label() const { return label; }

    // Child stored under value, nullptr if none
    const TreeNode* child(const BranchValue& value) const;

    size_t n_nodes() const;
    size_t n_leaves() const;
    uint16_t depth() const;

    void dump(std::ostream& out, int indent = 0) const;
};

// ============================================================================
// Tree
// ============================================================================

class Tree {
public:
    Tree() = default;
    explicit Tree(std::unique_ptr<TreeNode> root) : root_(std::move(root)) {}

    Tree(Tree&&) = default;
    Tree& operator=(Tree&&) = default;

    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;

    bool empty() const { return root_ == nullptr; }

    // Throws std::logic_error on an empty tree
    const TreeNode& root() const;

    const Label& classify(const Entity& entity) const;

    size_t n_nodes() const { return root_ ? root_->n_nodes() : 0; }
    size_t n_leaves() const { return root_ ? root_->n_leaves() : 0; }
    uint16_t depth() const { return root_ ? root_->depth() : 0; }

    void dump(std::ostream& out) const;

private:
    std::unique_ptr<TreeNode> root_;
};

// ============================================================================
// Tree Builder
// ============================================================================

class TreeBuilder {
public:
    explicit TreeBuilder(
        const FeatureRegistry& registry,
        const BuilderConfig& config = BuilderConfig(),
        int32_t verbosity = 0
    );

    TreeBuilder(const FeatureRegistry& registry, const Config& config);

    /**
     * Induce a subtree for entities.
     * Returns nullptr when a stopping rule fires at this level: entropy below
     * min_entropy, fewer than min_count entities, or no feature can split.
     * Throws std::invalid_argument on an empty entity set.
     */
    std::unique_ptr<TreeNode> build(const EntityList& entities) const;

    /**
     * Build a complete tree. When building stops at the root the tree is a
     * single leaf holding the majority label.
     */
    Tree fit(const EntityList& entities) const;
    Tree fit(const std::vector<Entity>& entities) const;

    const BuilderConfig& config() const { return config_; }
    const FeatureRegistry& registry() const { return registry_; }

private:
    const FeatureRegistry& registry_;
    BuilderConfig config_;
    int32_t verbosity_ = 0;

    std::unique_ptr<TreeNode> build_recursive(const EntityList& entities, int depth) const;
};

} // namespace commtree
